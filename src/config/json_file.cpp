#include "devflow/config/json_file.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace devflow {

ConfigResult<std::optional<Json>> read_json_file(const std::filesystem::path& file) {
    std::error_code ec;
    if (std::filesystem::exists(file, ec) == false) {
        if (ec) {
            return tl::unexpected(ConfigError::unreadable(file, ec.message()));
        }
        return std::optional<Json>{};
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return tl::unexpected(ConfigError::unreadable(file, "open failed"));
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        return tl::unexpected(ConfigError::unreadable(file, "read failed"));
    }

    Json parsed = Json::parse(contents.str(), nullptr, false);
    if (parsed.is_discarded()) {
        return tl::unexpected(ConfigError::malformed(file, "not valid JSON"));
    }
    return std::optional<Json>(std::move(parsed));
}

ConfigResult<void> write_json_file(const std::filesystem::path& file, const Json& document) {
    std::error_code ec;
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) {
            return tl::unexpected(ConfigError::write_failed(file, ec.message()));
        }
    }

    std::filesystem::path temp = file;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return tl::unexpected(ConfigError::write_failed(temp, "open failed"));
        }
        out << document.dump(2) << '\n';
        out.flush();
        if (!out) {
            return tl::unexpected(ConfigError::write_failed(temp, "write failed"));
        }
    }

    std::filesystem::rename(temp, file, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return tl::unexpected(ConfigError::write_failed(file, ec.message()));
    }
    return {};
}

}  // namespace devflow
