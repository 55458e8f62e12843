#include <handoff/base/event-loop.h>
#include <ytrace/ytrace.hpp>
#include <deque>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <uv.h>

namespace handoff {
namespace base {

struct TimerHandle {
    uv_timer_t timer;
    int id = -1;
    Timeout timeout = 0;
    std::vector<std::weak_ptr<EventListener>> listeners;
};

class EventLoopImpl : public EventLoop {
public:
    EventLoopImpl() = default;

    ~EventLoopImpl() override {
        closeHandles();
        // Let libuv deliver the pending close callbacks before tearing down
        uv_run(&_loop, UV_RUN_DEFAULT);
        int r = uv_loop_close(&_loop);
        if (r != 0) {
            ywarn("EventLoop: uv_loop_close failed: {}", uv_strerror(r));
        }
    }

    Result<void> init() noexcept {
        int r = uv_loop_init(&_loop);
        if (r != 0) {
            return Err<void>(std::string("uv_loop_init failed: ") + uv_strerror(r));
        }
        r = uv_async_init(&_loop, &_async, onAsync);
        if (r != 0) {
            return Err<void>(std::string("uv_async_init failed: ") + uv_strerror(r));
        }
        _async.data = this;
        _asyncOpen = true;
        return Ok();
    }

    int start() override {
        ydebug("EventLoop::start");
        _running = true;
        int r = uv_run(&_loop, UV_RUN_DEFAULT);
        _running = false;
        ydebug("EventLoop::start: loop exited ({})", r);
        return r;
    }

    Result<void> stop() override {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_asyncOpen) {
            return Ok();
        }
        _stopRequested = true;
        uv_async_send(&_async);
        return Ok();
    }

    Result<void> post(Task task) override {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_asyncOpen || _stopRequested) {
            return Err<void>(ErrorCode::ContextGone, "EventLoop is stopped");
        }
        _tasks.push_back(std::move(task));
        uv_async_send(&_async);
        return Ok();
    }

    bool isRunning() const override {
        return _running;
    }

    Result<TimerId> createTimer() override {
        TimerId id = _nextTimerId++;
        auto th = std::make_unique<TimerHandle>();
        th->id = id;
        int r = uv_timer_init(&_loop, &th->timer);
        if (r != 0) {
            return Err<TimerId>(std::string("uv_timer_init failed: ") + uv_strerror(r));
        }
        th->timer.data = th.get();
        _timers[id] = std::move(th);
        ydebug("EventLoop::createTimer: id={}", id);
        return Ok(id);
    }

    Result<void> configTimer(TimerId id, Timeout timeoutMs) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }

        auto& th = it->second;
        th->timeout = timeoutMs;
        if (uv_is_active(reinterpret_cast<uv_handle_t*>(&th->timer))) {
            uv_timer_start(&th->timer, onTimerCallback, timeoutMs, timeoutMs);
        }
        ydebug("EventLoop::configTimer: id={} timeout={}", id, timeoutMs);
        return Ok();
    }

    Result<void> startTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }

        auto& th = it->second;
        // A zero period would make libuv fire once; clamp so the timer repeats
        uint64_t period = th->timeout > 0 ? static_cast<uint64_t>(th->timeout) : 1;
        int r = uv_timer_start(&th->timer, onTimerCallback, period, period);
        if (r != 0) {
            return Err<void>(std::string("uv_timer_start failed: ") + uv_strerror(r));
        }
        return Ok();
    }

    Result<void> stopTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }

        uv_timer_stop(&it->second->timer);
        return Ok();
    }

    Result<void> destroyTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }

        closeTimer(std::move(it->second));
        _timers.erase(it);
        return Ok();
    }

    Result<void> registerTimerListener(TimerId id, EventListener::Ptr listener) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }

        it->second->listeners.push_back(listener);
        return Ok();
    }

private:
    static void onAsync(uv_async_t* handle) {
        auto* self = static_cast<EventLoopImpl*>(handle->data);
        self->drain();
    }

    void drain() {
        std::deque<Task> batch;
        bool stopping = false;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            batch.swap(_tasks);
            stopping = _stopRequested;
        }

        for (auto& task : batch) {
            task();
        }

        // post() rejects everything once the stop flag is up, so the batch
        // taken under that flag was the last one.
        if (stopping) {
            closeHandles();
        }
    }

    void closeHandles() {
        std::lock_guard<std::mutex> lock(_mutex);
        closeHandlesLocked();
    }

    void closeHandlesLocked() {
        if (_asyncOpen) {
            _asyncOpen = false;
            uv_close(reinterpret_cast<uv_handle_t*>(&_async), nullptr);
        }
        for (auto& [id, th] : _timers) {
            closeTimer(std::move(th));
        }
        _timers.clear();
    }

    static void closeTimer(std::unique_ptr<TimerHandle> th) {
        uv_timer_stop(&th->timer);
        auto* raw = th.release();
        uv_close(reinterpret_cast<uv_handle_t*>(&raw->timer), [](uv_handle_t* handle) {
            delete static_cast<TimerHandle*>(handle->data);
        });
    }

    static void onTimerCallback(uv_timer_t* handle) {
        auto* th = static_cast<TimerHandle*>(handle->data);

        Event event = Event::timer(th->id, uv_now(handle->loop));

        auto listeners = th->listeners;  // listener may destroy the timer
        for (const auto& wp : listeners) {
            if (auto sp = wp.lock()) {
                if (auto res = sp->onEvent(event); !res) {
                    yerror("EventLoop: timer {} listener failed: {}", event.timerId,
                           res.error().to_string());
                }
            }
        }
    }

    uv_loop_t _loop{};
    uv_async_t _async{};
    bool _asyncOpen = false;
    bool _running = false;

    std::mutex _mutex;
    std::deque<Task> _tasks;
    bool _stopRequested = false;

    std::unordered_map<TimerId, std::unique_ptr<TimerHandle>> _timers;
    TimerId _nextTimerId = 1;
};

Result<EventLoop::Ptr> EventLoop::createImpl() noexcept {
    auto loop = std::shared_ptr<EventLoopImpl>(new EventLoopImpl());
    if (auto res = loop->init(); !res) {
        return Err<Ptr>("Failed to initialize EventLoop", res);
    }
    return Ok(Ptr(std::move(loop)));
}

} // namespace base
} // namespace handoff
