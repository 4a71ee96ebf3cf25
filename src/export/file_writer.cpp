#include "export/file_writer.hpp"
#include "export/encoder.hpp"
#include "storage/measurement_store.hpp"

#include <lz4frame.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <sys/stat.h>
#include <vector>

namespace benchlog {

static bool ends_with(const std::string& s, const char* suffix) {
    size_t n = std::strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

static bool compress_payload(const std::string& payload, std::vector<char>& out) {
    LZ4F_preferences_t prefs;
    std::memset(&prefs, 0, sizeof(prefs));
    prefs.frameInfo.contentSize = payload.size();
    prefs.compressionLevel = 0;

    out.resize(LZ4F_compressFrameBound(payload.size(), &prefs));
    size_t n = LZ4F_compressFrame(out.data(), out.size(),
                                  payload.data(), payload.size(), &prefs);
    if (LZ4F_isError(n)) {
        std::fprintf(stderr, "  [EXPORT] LZ4 compression failed: %s\n", LZ4F_getErrorName(n));
        return false;
    }
    out.resize(n);
    return true;
}

Error write_export_file(const std::string& path, const std::string& payload) {
    if (path.empty()) {
        std::fprintf(stderr, "  [EXPORT] No output path given\n");
        return Error::IOFailure;
    }

    const char* data = payload.data();
    size_t len = payload.size();
    std::vector<char> compressed;
    if (ends_with(path, ".lz4")) {
        if (!compress_payload(payload, compressed)) return Error::IOFailure;
        data = compressed.data();
        len = compressed.size();
    }

    // Temporary file beside the target so rename() stays on one filesystem
    std::string tmpl = path + ".XXXXXX";
    std::vector<char> tmp_path(tmpl.begin(), tmpl.end());
    tmp_path.push_back('\0');

    int fd = ::mkstemp(tmp_path.data());
    if (fd < 0) {
        std::fprintf(stderr, "  [EXPORT] Cannot create %s: %s\n",
                     tmp_path.data(), std::strerror(errno));
        return Error::IOFailure;
    }

    // mkstemp creates 0600
    ::fchmod(fd, 0644);

    FILE* file = ::fdopen(fd, "wb");
    if (!file) {
        std::fprintf(stderr, "  [EXPORT] fdopen: %s\n", std::strerror(errno));
        ::close(fd);
        ::unlink(tmp_path.data());
        return Error::IOFailure;
    }

    // 1MB write buffer
    std::vector<char> file_buf(1024 * 1024);
    std::setvbuf(file, file_buf.data(), _IOFBF, file_buf.size());

    bool ok = std::fwrite(data, 1, len, file) == len;
    ok = (std::fflush(file) == 0) && ok;
    ok = (::fsync(fd) == 0) && ok;
    int saved_errno = errno;
    ok = (std::fclose(file) == 0) && ok;

    if (!ok) {
        std::fprintf(stderr, "  [EXPORT] Write to %s failed: %s\n",
                     tmp_path.data(), std::strerror(saved_errno));
        ::unlink(tmp_path.data());
        return Error::IOFailure;
    }

    if (std::rename(tmp_path.data(), path.c_str()) != 0) {
        std::fprintf(stderr, "  [EXPORT] rename to %s failed: %s\n",
                     path.c_str(), std::strerror(errno));
        ::unlink(tmp_path.data());
        return Error::IOFailure;
    }

    std::printf("  [EXPORT] Wrote %zu bytes to %s\n", len, path.c_str());
    return Error::Ok;
}

Error export_to_file(const MeasurementStore& store, ExportFormat format,
                     const std::optional<std::string>& device, const std::string& path) {
    std::string payload;
    Error err = export_measurements(store, format, device, payload);
    if (err != Error::Ok) return err;

    return write_export_file(path, payload);
}

} // namespace benchlog
