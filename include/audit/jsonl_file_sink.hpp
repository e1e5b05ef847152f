#pragma once

#include "audit/event_sink.hpp"
#include <cstddef>
#include <fstream>
#include <string>

namespace personaguard {

/**
 * @brief Appends security events to a JSONL file, rotating by size
 *
 * Rotation keeps one predecessor: events.jsonl -> events.jsonl.1.
 */
class JsonlFileSink : public IEventSink {
public:
    struct Config {
        std::string path = "security-events.jsonl";
        size_t max_file_size_bytes = 10ULL * 1024 * 1024;
    };

    explicit JsonlFileSink(Config config);
    ~JsonlFileSink() override;

    [[nodiscard]] bool write(std::string_view jsonl) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

private:
    void rotate();

    Config config_;
    std::ofstream out_;
    size_t current_size_ = 0;
};

} // namespace personaguard
