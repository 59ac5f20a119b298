#include "OutputWriter.h"
#include "../../include/Logger.h"
#include <fstream>
#include <system_error>

namespace site_mirror::crawler {

bool writeOutputFile(const std::filesystem::path& root,
                     const std::string& relativePath,
                     const std::string& content) {
    std::filesystem::path target = root / relativePath;
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        LOG_ERROR("Could not create directory " + target.parent_path().string() + ": " + ec.message());
        return false;
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        LOG_ERROR("Could not open " + target.string() + " for writing");
        return false;
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        LOG_ERROR("Could not write " + target.string());
        return false;
    }
    return true;
}

} // namespace site_mirror::crawler
