#include "compression.hpp"
#include <filesystem>
#include <fstream>
#include <zlib.h>

namespace fs = std::filesystem;

namespace {

std::string gzErrorText(gzFile file) {
    int code = Z_OK;
    const char* message = gzerror(file, &code);
    return message ? message : "unknown zlib error";
}

void removeQuietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

Result<void> gzipFile(const std::string& inputFile, const std::string& outputFile) {
    std::ifstream inFile(inputFile, std::ios::binary);
    if (!inFile) {
        return makeError(ErrorKind::Io, "Failed to open file for compression: " + inputFile);
    }
    gzFile outFile = gzopen(outputFile.c_str(), "wb6");
    if (!outFile) {
        return makeError(ErrorKind::Io, "Failed to open gzip file for writing: " + outputFile);
    }

    char buf[65536];
    while (inFile) {
        inFile.read(buf, sizeof(buf));
        auto count = inFile.gcount();
        if (count > 0 && gzwrite(outFile, buf, static_cast<unsigned>(count)) != static_cast<int>(count)) {
            std::string detail = gzErrorText(outFile);
            gzclose(outFile);
            removeQuietly(outputFile);
            return makeError(ErrorKind::Io, "Failed to write gzip data to " + outputFile + ": " + detail);
        }
    }
    if (inFile.bad()) {
        gzclose(outFile);
        removeQuietly(outputFile);
        return makeError(ErrorKind::Io, "Failed to read " + inputFile);
    }
    if (gzclose(outFile) != Z_OK) {
        removeQuietly(outputFile);
        return makeError(ErrorKind::Io, "Failed to finalize gzip file " + outputFile);
    }
    return {};
}

Result<void> gunzipFile(const std::string& inputFile, const std::string& outputFile) {
    gzFile inFile = gzopen(inputFile.c_str(), "rb");
    if (!inFile) {
        return makeError(ErrorKind::Io, "Failed to open gzip file for reading: " + inputFile);
    }
    std::ofstream outFile(outputFile, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        gzclose(inFile);
        return makeError(ErrorKind::Io, "Failed to create decompressed file: " + outputFile);
    }

    char buf[65536];
    int count;
    while ((count = gzread(inFile, buf, sizeof(buf))) > 0) {
        outFile.write(buf, count);
        if (!outFile) {
            gzclose(inFile);
            outFile.close();
            removeQuietly(outputFile);
            return makeError(ErrorKind::Io, "Failed to write decompressed data to " + outputFile);
        }
    }
    if (count < 0) {
        std::string detail = gzErrorText(inFile);
        gzclose(inFile);
        outFile.close();
        removeQuietly(outputFile);
        return makeError(ErrorKind::Format, "Corrupt gzip data in " + inputFile + ": " + detail);
    }
    if (gzdirect(inFile)) {
        gzclose(inFile);
        outFile.close();
        removeQuietly(outputFile);
        return makeError(ErrorKind::Format, "Not a gzip file: " + inputFile);
    }
    gzclose(inFile);
    outFile.close();
    return {};
}
