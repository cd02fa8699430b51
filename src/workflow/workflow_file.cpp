#include "wfsync/workflow/workflow_file.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

namespace wfsync::workflow {
namespace fs = std::filesystem;

Result<Document> read_document(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Err<Document>(ErrorCode::NotFound, "File not found: " + path.string());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<Document>(ErrorCode::Io, "Failed to open file: " + path.string());
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto document = Document::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return Err<Document>(ErrorCode::InvalidData, "Malformed JSON in " + path.string());
    }
    return Ok(std::move(document));
}

Result<void> write_document(const fs::path& path, const Document& document) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Err<void>(ErrorCode::Io, "Failed to create directory " +
                                                path.parent_path().string() + ": " + ec.message());
        }
    }

    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const fs::path temp = path.parent_path() /
                          ("." + path.filename().string() + ".tmp" + std::to_string(stamp));
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorCode::Io, "Failed to open " + temp.string() + " for writing");
        }
        output << document.dump(2, ' ', false, Document::error_handler_t::replace);
        output.flush();
        if (!output) {
            output.close();
            fs::remove(temp, ec);
            return Err<void>(ErrorCode::Io, "Failed to write " + temp.string());
        }
    }

    fs::rename(temp, path, ec);
    if (ec) {
        const auto message = ec.message();
        fs::remove(temp, ec);
        return Err<void>(ErrorCode::Io, "Failed to replace " + path.string() + ": " + message);
    }
    return Ok();
}

bool is_hidden_name(const std::string& filename) {
    return !filename.empty() && filename.front() == '.';
}

bool is_workflow_filename(const std::string& filename) {
    static const std::string kSuffix = ".json";
    if (is_hidden_name(filename) || filename.size() <= kSuffix.size()) {
        return false;
    }
    return filename.compare(filename.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0;
}

} // namespace wfsync::workflow
