/*
 * File: src/toolsync_stream.hpp
 * Project: Tool Sync
 * Purpose: Timer-driven live delivery over a chunked HTTP response
 * Notes:
 *  - StreamPump owns the heartbeat and poll timers; a hub publish on the
 *    deployment channel triggers an immediate poll
 *  - Frames are NDJSON, or SSE "data:" blocks when the client asked for text/event-stream
 *  - All handlers run on the connection's executor (a strand)
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "common/channel_hub.hpp"
#include "common/log.hpp"
#include "common/stream_channel.hpp"
#include "toolsync_state.hpp"

namespace http = boost::beast::http;

class StreamPump : public std::enable_shared_from_this<StreamPump>
{
public:
    using Sink = std::function<void(const nlohmann::json &frame)>;
    using Executor = boost::asio::any_io_executor;

    StreamPump(Executor ex, SyncEngine &engine, ChannelHub *hub, StreamParams params,
               std::chrono::milliseconds heartbeat, std::chrono::milliseconds poll, Sink sink)
        : ex_(ex), channel_(engine, std::move(params)), hub_(hub), heartbeat_every_(heartbeat),
          poll_every_(poll), heartbeat_timer_(ex), poll_timer_(ex), sink_(std::move(sink)) {}

    StreamState state() const { return channel_.state(); }

    void start()
    {
        auto self = shared_from_this();
        boost::asio::post(ex_, [self]
                          { self->on_start(); });
    }

    void stop()
    {
        auto self = shared_from_this();
        boost::asio::post(ex_, [self]
                          { self->on_stop(); });
    }

private:
    void on_start()
    {
        if (channel_.state() != StreamState::Connecting)
            return;
        emit(channel_.open());
        if (channel_.state() != StreamState::Streaming)
            return;
        if (hub_)
        {
            std::weak_ptr<StreamPump> weak = shared_from_this();
            auto ex = ex_;
            subscription_ = hub_->subscribe("deployment:" + channel_.params().deployment_id + ":updates",
                                            [weak, ex](const std::string &, const nlohmann::json &)
                                            {
                                                boost::asio::post(ex, [weak]
                                                                  {
                                                    if (auto self = weak.lock())
                                                        self->do_poll(); });
                                            });
        }
        arm_heartbeat();
        arm_poll();
    }

    void on_stop()
    {
        if (channel_.state() == StreamState::Closed)
            return;
        channel_.close();
        heartbeat_timer_.cancel();
        poll_timer_.cancel();
        if (hub_ && subscription_)
            hub_->unsubscribe(*subscription_);
        subscription_.reset();
    }

    void arm_heartbeat()
    {
        heartbeat_timer_.expires_after(heartbeat_every_);
        auto self = shared_from_this();
        heartbeat_timer_.async_wait([self](boost::system::error_code ec)
                                    {
            if (ec || self->channel_.state() != StreamState::Streaming)
                return;
            self->emit(self->channel_.heartbeat());
            self->arm_heartbeat(); });
    }

    void arm_poll()
    {
        poll_timer_.expires_after(poll_every_);
        auto self = shared_from_this();
        poll_timer_.async_wait([self](boost::system::error_code ec)
                               {
            if (ec || self->channel_.state() != StreamState::Streaming)
                return;
            self->do_poll();
            self->arm_poll(); });
    }

    void do_poll()
    {
        for (const auto &f : channel_.poll())
        {
            if (channel_.state() != StreamState::Streaming)
                return;
            emit(f);
        }
    }

    void emit(const nlohmann::json &frame)
    {
        try
        {
            sink_(frame);
        }
        catch (const std::exception &e)
        {
            log_warn("stream", std::string("sink failed, closing: ") + e.what());
            on_stop();
        }
    }

    Executor ex_;
    StreamChannel channel_;
    ChannelHub *hub_;
    std::chrono::milliseconds heartbeat_every_;
    std::chrono::milliseconds poll_every_;
    boost::asio::steady_timer heartbeat_timer_;
    boost::asio::steady_timer poll_timer_;
    Sink sink_;
    std::optional<std::uint64_t> subscription_;
};

inline std::string encode_stream_frame(const nlohmann::json &frame, bool sse)
{
    if (sse)
        return "data: " + frame.dump() + "\n\n";
    return frame.dump() + "\n";
}

// Owns the socket after the HTTP router chose stream mode.
class StreamHttpSession : public std::enable_shared_from_this<StreamHttpSession>
{
    boost::asio::ip::tcp::socket socket_;
    ToolSyncState &state_;
    StreamParams params_;
    bool sse_;
    std::shared_ptr<StreamPump> pump_;
    std::deque<std::shared_ptr<std::string>> out_;
    bool writing_ = false;
    bool closed_ = false;
    std::shared_ptr<http::response<http::empty_body>> head_;
    std::shared_ptr<http::response_serializer<http::empty_body>> head_sr_;
    std::array<char, 256> drain_{};

public:
    StreamHttpSession(boost::asio::ip::tcp::socket &&s, ToolSyncState &st, StreamParams params, bool sse)
        : socket_(std::move(s)), state_(st), params_(std::move(params)), sse_(sse) {}

    ~StreamHttpSession() { --state_.open_streams; }

    void start(unsigned version)
    {
        ++state_.open_streams;
        head_ = std::make_shared<http::response<http::empty_body>>(http::status::ok, version);
        head_->set(http::field::server, "toolsync-beast");
        head_->set(http::field::content_type, sse_ ? "text/event-stream" : "application/x-ndjson");
        head_->set(http::field::cache_control, "no-cache, no-transform");
        head_->set(http::field::connection, "keep-alive");
        head_->set("X-Accel-Buffering", "no");
        head_->chunked(true);
        head_sr_ = std::make_shared<http::response_serializer<http::empty_body>>(*head_);

        auto self = shared_from_this();
        std::weak_ptr<StreamHttpSession> weak = self;
        pump_ = std::make_shared<StreamPump>(
            socket_.get_executor(), *state_.engine, &state_.hub, params_,
            std::chrono::milliseconds(state_.config.heartbeat_ms), std::chrono::milliseconds(state_.config.poll_ms),
            [weak](const nlohmann::json &frame)
            {
                if (auto s = weak.lock())
                    s->enqueue(encode_stream_frame(frame, s->sse_));
            });

        http::async_write_header(socket_, *head_sr_, [self](boost::beast::error_code ec, std::size_t)
                                 {
            if (ec)
                return self->close("header write: " + ec.message());
            log_info("stream", "user " + self->params_.user_id + " streaming deployment " + self->params_.deployment_id);
            self->pump_->start();
            self->watch_disconnect(); });
    }

private:
    // The client sends nothing after the request; any read completion means it went away.
    void watch_disconnect()
    {
        auto self = shared_from_this();
        socket_.async_read_some(boost::asio::buffer(drain_), [self](boost::beast::error_code ec, std::size_t)
                                {
            if (ec)
                return self->close("client disconnected");
            self->watch_disconnect(); });
    }

    void enqueue(std::string frame)
    {
        if (closed_)
            return;
        out_.push_back(std::make_shared<std::string>(std::move(frame)));
        if (!writing_)
            write_next();
    }

    void write_next()
    {
        if (out_.empty() || closed_)
        {
            writing_ = false;
            return;
        }
        writing_ = true;
        auto data = out_.front();
        out_.pop_front();
        auto self = shared_from_this();
        boost::asio::async_write(socket_, http::make_chunk(boost::asio::buffer(*data)),
                                 [self, data](boost::beast::error_code ec, std::size_t)
                                 {
                                     if (ec)
                                         return self->close("write: " + ec.message());
                                     self->write_next();
                                 });
    }

    void close(const std::string &why)
    {
        if (closed_)
            return;
        closed_ = true;
        out_.clear();
        if (pump_)
            pump_->stop();
        log_info("stream", "closed deployment " + params_.deployment_id + " for " + params_.user_id + " (" + why + ")");
        boost::system::error_code ignored;
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
};
