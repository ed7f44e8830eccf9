#include "durable_logger.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <system_error>
#include <vector>

namespace opcualogger {

DurableLogger::DurableLogger(std::filesystem::path path, RecordCodec codec)
    : path_(std::move(path))
    , codec_(codec)
    , failed_(false)
    , records_written_(0) {
}

std::uintmax_t DurableLogger::recover() {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) {
            throw WriteError("Cannot inspect record store '" + path_.string() + "': " + ec.message());
        }
        return 0;
    }

    if (!fs::is_regular_file(path_, ec)) {
        throw WriteError("Record store '" + path_.string() + "' is not a regular file");
    }

    const std::uintmax_t size = fs::file_size(path_, ec);
    if (ec) {
        throw WriteError("Cannot inspect record store '" + path_.string() + "': " + ec.message());
    }
    if (size == 0) {
        return 0;
    }

    std::ifstream file(path_, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw WriteError("Cannot open record store '" + path_.string() + "': " + std::strerror(errno));
    }

    // 从尾部向前找最后一个记录分隔符
    const std::uintmax_t chunk_size = 4096;
    std::vector<char> buffer(chunk_size);
    std::uintmax_t keep = 0;
    bool found = false;
    std::uintmax_t end = size;

    while (end > 0 && !found) {
        std::uintmax_t start = end > chunk_size ? end - chunk_size : 0;
        auto length = static_cast<std::streamsize>(end - start);

        file.seekg(static_cast<std::streamoff>(start));
        file.read(buffer.data(), length);
        if (!file) {
            throw WriteError("Cannot read record store '" + path_.string() + "'");
        }

        for (std::streamsize i = length; i > 0; --i) {
            if (buffer[static_cast<size_t>(i - 1)] == '\n') {
                keep = start + static_cast<std::uintmax_t>(i);
                found = true;
                break;
            }
        }
        end = start;
    }
    file.close();

    if (keep == size) {
        return 0;
    }

    fs::resize_file(path_, keep, ec);
    if (ec) {
        throw WriteError("Cannot truncate incomplete record in '" + path_.string() + "': " + ec.message());
    }

    std::cerr << "Warning: removed " << (size - keep) << " bytes of incomplete record at end of "
              << path_.string() << std::endl;
    return size - keep;
}

void DurableLogger::append(const Reading& reading) {
    if (failed_) {
        throw WriteError("Record store '" + path_.string() + "' is unavailable after a previous write failure");
    }

    // 整行先在内存中组装好，再一次写入并刷新
    std::string record = codec_.format(reading);
    record.push_back('\n');

    std::ofstream file(path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!file.is_open()) {
        failed_ = true;
        throw WriteError("Cannot open record store '" + path_.string() + "': " + std::strerror(errno));
    }

    file.write(record.data(), static_cast<std::streamsize>(record.size()));
    file.flush();
    if (!file.good()) {
        failed_ = true;
        throw WriteError("Failed writing to record store '" + path_.string() + "'");
    }

    ++records_written_;
}

} // namespace opcualogger
