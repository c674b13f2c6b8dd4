#include "util/file_utils.hpp"

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace bundler {

Result ReadFileToString(const std::string& path, std::string& out) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return Result::Fail(ENOENT, "cannot open " + path);
    }
    out.assign(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
    if (is.bad()) {
        return Result::Fail(EIO, "read failed: " + path);
    }
    return Result::Ok();
}

Result WriteFileAtomic(const std::string& path, std::string_view content) {
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream os(tmp_path, std::ios::binary | std::ios::trunc);
        if (!os.good()) {
            return Result::Fail(EIO, "cannot create " + tmp_path);
        }
        os.write(content.data(), static_cast<std::streamsize>(content.size()));
        os.flush();
        if (!os.good()) {
            os.close();
            ::unlink(tmp_path.c_str());
            return Result::Fail(EIO, "write failed: " + tmp_path);
        }
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        auto res = Result::FromErrno("rename " + tmp_path + " -> " + path);
        ::unlink(tmp_path.c_str());
        return res;
    }
    return Result::Ok();
}

Result RemoveIfExists(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot remove " + path + ": " + ec.message());
    }
    return Result::Ok();
}

} // namespace bundler
