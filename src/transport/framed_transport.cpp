#include "devflow/transport/framed_transport.hpp"
#include "devflow/log/logger.hpp"

#include <asio/bind_executor.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/dispatch.hpp>
#include <asio/use_awaitable.hpp>

#include <array>

namespace devflow {

namespace {

constexpr std::size_t kReadChunkSize = 8192;

TransportError make_error(TransportError::Category cat, std::string msg) {
    return TransportError{cat, std::move(msg), std::nullopt};
}

TransportError make_error(TransportError::Category cat, std::string msg, const std::error_code& ec) {
    return TransportError{cat, std::move(msg), ec.value()};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

FramedTransport::FramedTransport(asio::any_io_executor executor, FramedTransportConfig config)
    : config_(config)
    , executor_(std::move(executor))
    , strand_(asio::make_strand(executor_))
    , inbox_(std::make_unique<Inbox>(strand_, config_.inbox_capacity))
    , outbox_(std::make_unique<Outbox>(strand_, config_.outbox_capacity))
{}

asio::any_io_executor FramedTransport::get_executor() {
    return strand_;
}

bool FramedTransport::is_running() const {
    return running_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<TransportResult<void>> FramedTransport::async_start() {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    if (started_ || stopped_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Transport already started"
        ));
    }

    auto opened = co_await open_streams();
    if (!opened) {
        co_return opened;
    }

    started_ = true;
    running_ = true;

    auto self = shared_from_this();
    asio::co_spawn(strand_, [self]() { return self->reader_loop(); }, asio::detached);
    asio::co_spawn(strand_, [self]() { return self->writer_loop(); }, asio::detached);

    DEVFLOW_LOG_DEBUG("Transport started: {}", describe());
    co_return TransportResult<void>{};
}

asio::awaitable<void> FramedTransport::async_stop() {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    if (stopped_.exchange(true)) {
        co_return;
    }
    running_ = false;

    close_streams();
    outbox_->close();
    inbox_->close();

    DEVFLOW_LOG_DEBUG("Transport stopped: {}", describe());
}

// ═══════════════════════════════════════════════════════════════════════════
// Send / Receive
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<TransportResult<void>> FramedTransport::async_send(Json message) {
    if (!running_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Closed,
            "Transport not running"
        ));
    }

    std::string frame = encode_frame(message);
    if (frame.size() > config_.max_frame_size) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Message of " + std::to_string(frame.size()) + " bytes exceeds frame limit"
        ));
    }

    try {
        co_await outbox_->async_send(asio::error_code{}, std::move(frame), asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Closed,
            "Transport stopped before send",
            e.code()
        ));
    }
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<Json>> FramedTransport::async_receive() {
    if (terminal_delivered_ || stopped_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Closed,
            "Transport closed"
        ));
    }

    try {
        auto result = co_await inbox_->async_receive(asio::use_awaitable);
        if (!result && is_terminal(result.error())) {
            terminal_delivered_ = true;
        }
        co_return result;
    } catch (const std::system_error& e) {
        terminal_delivered_ = true;
        co_return tl::unexpected(make_error(
            TransportError::Category::Closed,
            "Transport stopped",
            e.code()
        ));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Loops
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> FramedTransport::reader_loop() {
    std::array<char, kReadChunkSize> chunk{};
    LineFramer framer(config_.max_frame_size);
    TransportError terminal = make_error(TransportError::Category::Closed, "Connection closed by peer");

    try {
        while (running_) {
            std::size_t n = 0;
            try {
                n = co_await read_some(asio::buffer(chunk));
            } catch (const std::system_error& e) {
                if (e.code() == asio::error::eof) {
                    terminal = make_error(TransportError::Category::Closed, "Connection closed by peer", e.code());
                } else if (!running_ || e.code() == asio::error::operation_aborted) {
                    terminal = make_error(TransportError::Category::Closed, "Transport stopped", e.code());
                } else {
                    terminal = make_error(TransportError::Category::Network,
                                          std::string("Read failed: ") + e.what(), e.code());
                }
                break;
            }

            framer.feed(std::string_view(chunk.data(), n));
            while (auto frame = framer.next()) {
                TransportResult<Json> decoded = frame->has_value()
                    ? decode_frame(**frame)
                    : TransportResult<Json>(tl::unexpected(frame->error()));
                if (!decoded) {
                    DEVFLOW_LOG_DEBUG("Bad frame from {}: {}", describe(), decoded.error().message);
                }
                co_await inbox_->async_send(asio::error_code{}, std::move(decoded), asio::use_awaitable);
            }
        }

        running_ = false;
        co_await inbox_->async_send(asio::error_code{},
                                    TransportResult<Json>(tl::unexpected(terminal)),
                                    asio::use_awaitable);
    } catch (const std::system_error& e) {
        // Inbox closed by async_stop(); nobody is listening anymore.
        running_ = false;
        DEVFLOW_LOG_TRACE("Reader for {} exiting: {}", describe(), e.what());
    }
    outbox_->close();
}

asio::awaitable<void> FramedTransport::writer_loop() {
    while (true) {
        std::string frame;
        try {
            frame = co_await outbox_->async_receive(asio::use_awaitable);
        } catch (const std::system_error&) {
            break;
        }

        try {
            co_await write_all(asio::buffer(frame));
        } catch (const std::system_error& e) {
            if (running_) {
                DEVFLOW_LOG_WARN("Write to {} failed: {}", describe(), e.what());
            }
            running_ = false;
            close_streams();
            break;
        }
    }
}

}  // namespace devflow
