#pragma once

namespace pm2d {

// Lives as long as the application; shared by every game started in it.
struct SessionState {
    int highScore{0};
};

} // namespace pm2d
