#pragma once

/// In-memory sink recording every frame a connection writes

#include <accord/coro/task.hpp>
#include <accord/server/connection.hpp>
#include <accord/server/sink.hpp>

#include <memory>
#include <string>
#include <vector>

namespace accord::test {

/// Shared between a test and the sink the connection owns
struct sink_record {
    std::vector<std::string> frames;
    bool closed = false;
    bool fail_writes = false;    ///< simulate the peer going away
    bool backpressure = false;   ///< report every write as backpressured
    int close_calls = 0;

    std::string joined() const {
        std::string out;
        for (const auto& frame : frames) {
            out += frame;
        }
        return out;
    }
};

class memory_sink final : public server::sink {
public:
    explicit memory_sink(std::shared_ptr<sink_record> record) : record_(std::move(record)) {}

    coro::task<server::write_result> write(std::string data) override {
        if (record_->closed || record_->fail_writes) {
            co_return server::write_result{false, false};
        }
        record_->frames.push_back(std::move(data));
        co_return server::write_result{true, record_->backpressure};
    }

    void close() noexcept override {
        record_->closed = true;
        ++record_->close_calls;
    }

    bool is_closed() const noexcept override { return record_->closed; }

private:
    std::shared_ptr<sink_record> record_;
};

/// Connection over a fresh memory_sink
inline std::shared_ptr<server::connection> memory_connection(std::shared_ptr<sink_record> record,
                                                             size_t high_water_mark = 64 * 1024) {
    return std::make_shared<server::connection>(std::make_unique<memory_sink>(std::move(record)), high_water_mark);
}

} // namespace accord::test
