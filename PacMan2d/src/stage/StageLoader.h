#pragma once
#include "stage/StageStatus.h"
#include "stage/SymbolGrid.h"
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace pm2d {

struct SymbolGridLoad {
    StageStatus status{StageStatus::Ok};
    std::string message{};
    SymbolGrid symbols{};

    bool ok() const { return status == StageStatus::Ok; }
};

// Stage documents look like {"grid": [...]} where each row is either a string
// or an array of one-character strings. Rows are listed top to bottom.
SymbolGridLoad parseSymbolGrid(const nlohmann::json& document);
SymbolGridLoad loadSymbolGrid(const std::string& path);

} // namespace pm2d
