#include "audit/jsonl_file_sink.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace personaguard {

JsonlFileSink::JsonlFileSink(Config config)
    : config_(std::move(config)) {
    out_.open(config_.path, std::ios::app);
    if (!out_.is_open()) {
        throw std::runtime_error("Failed to open security event file: " + config_.path);
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(config_.path, ec);
    if (!ec) {
        current_size_ = static_cast<size_t>(size);
    }
}

JsonlFileSink::~JsonlFileSink() {
    shutdown();
}

bool JsonlFileSink::write(std::string_view jsonl) {
    if (!out_.is_open()) return false;
    if (current_size_ + jsonl.size() > config_.max_file_size_bytes && current_size_ > 0) {
        rotate();
    }
    out_.write(jsonl.data(), static_cast<std::streamsize>(jsonl.size()));
    current_size_ += jsonl.size();
    return out_.good();
}

void JsonlFileSink::flush() {
    if (out_.is_open()) out_.flush();
}

void JsonlFileSink::shutdown() {
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

std::string JsonlFileSink::name() const {
    return "jsonl:" + config_.path;
}

void JsonlFileSink::rotate() {
    out_.flush();
    out_.close();

    std::error_code ec;
    std::filesystem::rename(config_.path, config_.path + ".1", ec);
    if (ec) {
        utils::log::warn(std::format("Security event rotation failed for {}: {}",
                                     config_.path, ec.message()));
    }

    out_.open(config_.path, std::ios::app);
    current_size_ = 0;
}

} // namespace personaguard
