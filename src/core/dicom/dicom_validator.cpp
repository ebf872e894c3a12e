#include "core/dicom_validator.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace dicom_transfer::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("Validator");
    return logger;
}

} // anonymous namespace

bool DicomValidator::isDicomObject(const std::filesystem::path& path) noexcept {
    try {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec) || ec) {
            return false;
        }

        auto size = std::filesystem::file_size(path, ec);
        if (ec || size < MINIMUM_FILE_SIZE) {
            return false;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            getLogger()->debug("Cannot open {} for signature check", path.string());
            return false;
        }

        file.seekg(static_cast<std::streamoff>(PREAMBLE_LENGTH), std::ios::beg);
        std::array<char, MAGIC.size()> magic{};
        file.read(magic.data(), static_cast<std::streamsize>(magic.size()));
        if (file.gcount() != static_cast<std::streamsize>(magic.size())) {
            return false;
        }

        return std::equal(magic.begin(), magic.end(), MAGIC.begin());
    } catch (const std::exception&) {
        // Logger or stream allocation failures must not escape the walk
        return false;
    }
}

} // namespace dicom_transfer::core
