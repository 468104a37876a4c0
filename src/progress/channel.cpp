#include "drop/progress/channel.hpp"

namespace drop::progress {

nlohmann::json to_json(const FileTransfer& file) {
    return nlohmann::json{
        {"name", file.name},
        {"transferred", file.transferred},
        {"total", file.total}
    };
}

nlohmann::json to_json(const Snapshot& snapshot) {
    nlohmann::json files = nlohmann::json::array();
    for (const auto& file : snapshot) {
        files.push_back(to_json(file));
    }
    return files;
}

} // namespace drop::progress
