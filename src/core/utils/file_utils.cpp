#include "file_utils.h"

#include <fstream>
#include <sstream>

#include "log.h"

namespace sc {
namespace file {

namespace {

Path tempSibling(const Path& path) {
    Path temp = path;
    temp += ".partial";
    return temp;
}

void removeQuietly(const Path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

Result<std::string> readText(const Path& path) {
    if (!isFile(path)) {
        log::errorf("FileIO", "Not a readable file: %s", path.string().c_str());
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        log::errorf("FileIO", "Failed to open for reading: %s", path.string().c_str());
        return std::nullopt;
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        log::errorf("FileIO", "Read error: %s", path.string().c_str());
        return std::nullopt;
    }
    return ss.str();
}

bool writeText(const Path& path, std::string_view content) {
    Path parent = path.parent_path();
    if (!parent.empty() && !file::exists(parent) && !file::createDirectories(parent)) {
        return false;
    }

    const Path temp = tempSibling(path);
    {
        std::ofstream out(temp, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out.is_open()) {
            log::errorf("FileIO", "Failed to open for writing: %s", temp.string().c_str());
            return false;
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out.good()) {
            log::errorf("FileIO", "Write error: %s", temp.string().c_str());
            out.close();
            removeQuietly(temp);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp, path, ec);
    if (ec) {
        log::errorf("FileIO", "Failed to replace %s (%s)", path.string().c_str(),
                    ec.message().c_str());
        removeQuietly(temp);
        return false;
    }
    return true;
}

bool exists(const Path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool isFile(const Path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool createDirectories(const Path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        log::errorf("FileIO", "Failed to create directories: %s (%s)", path.string().c_str(),
                    ec.message().c_str());
        return false;
    }
    return fs::is_directory(path, ec);
}

} // namespace file
} // namespace sc
