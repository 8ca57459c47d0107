#include "stage/StageLoader.h"
#include "services/configuration/json_io.h"
#include "services/logger/LogManager.h"
#include <nlohmann/json.hpp>
#include <utility>
#include <vector>

using nlohmann::json;

namespace pm2d {
namespace {

SymbolGridLoad fail(StageStatus status, std::string message) {
    SymbolGridLoad out;
    out.status = status;
    out.message = std::move(message);
    return out;
}

bool read_row(const json& row, std::string& out) {
    if (row.is_string()) {
        out = row.get<std::string>();
        return true;
    }
    if (!row.is_array()) return false;
    out.clear();
    out.reserve(row.size());
    for (const auto& cell : row) {
        if (!cell.is_string()) return false;
        const auto& s = cell.get_ref<const std::string&>();
        out.push_back(s.empty() ? ' ' : s.front());
    }
    return true;
}

} // namespace

SymbolGridLoad parseSymbolGrid(const json& document) {
    if (!document.is_object()) return fail(StageStatus::BadFormat, "stage document is not an object");
    auto it = document.find("grid");
    if (it == document.end() || !it->is_array()) {
        return fail(StageStatus::BadFormat, "stage document has no \"grid\" array");
    }
    if (it->empty()) return fail(StageStatus::BadFormat, "stage grid is empty");

    std::vector<std::string> rows;
    rows.reserve(it->size());
    std::size_t width = 0;
    for (std::size_t i = 0; i < it->size(); ++i) {
        std::string line;
        if (!read_row((*it)[i], line)) {
            return fail(StageStatus::BadFormat, fmt::format("stage row {} is not a string or array of strings", i));
        }
        if (i == 0) width = line.size();
        if (line.size() != width) {
            return fail(StageStatus::BadFormat, fmt::format("stage row {} has {} cells, expected {}", i, line.size(), width));
        }
        rows.push_back(std::move(line));
    }

    SymbolGridLoad out;
    out.symbols = SymbolGrid(std::move(rows));
    return out;
}

SymbolGridLoad loadSymbolGrid(const std::string& path) {
    auto doc = jsonio::readJson(path);
    if (!doc) {
        logging::LogManager::error("Stage file '{}' is missing or not valid JSON", path);
        return fail(StageStatus::FileUnreadable, "cannot read stage file '" + path + "'");
    }
    auto result = parseSymbolGrid(*doc);
    if (!result.ok()) {
        logging::LogManager::error("Stage file '{}' rejected: {}", path, result.message);
        return result;
    }
    logging::LogManager::info("Loaded stage '{}' ({}x{})", path, result.symbols.cols(), result.symbols.rows());
    return result;
}

} // namespace pm2d
