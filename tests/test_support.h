// test_support.h - Helpers for driving a Runtime over the headless toolkit

#ifndef WEBSHELL_TEST_SUPPORT_H
#define WEBSHELL_TEST_SUPPORT_H

#include <catch2/catch.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../src/native/headless/headless.h"
#include "../src/native/shared/error.h"
#include "../src/native/shared/runtime.h"

namespace webshell {

const std::chrono::seconds TEST_TIMEOUT(5);

// A Runtime on a headless loop. start() runs the loop on a background thread;
// the destructor terminates the loop if it is still running and waits for it.
struct HeadlessRuntime {
    std::shared_ptr<HeadlessController> controller;
    std::unique_ptr<Runtime> runtime;
    std::future<void> finished;

    HeadlessRuntime() {
        std::unique_ptr<HeadlessEventLoop> loop(new HeadlessEventLoop());
        controller = loop->controller();
        runtime.reset(new Runtime(std::move(loop)));
    }

    ~HeadlessRuntime() {
        if (finished.valid()) {
            controller->terminate();
            finished.wait();
        }
    }

    HeadlessRuntime(const HeadlessRuntime&) = delete;
    HeadlessRuntime& operator=(const HeadlessRuntime&) = delete;

    // Builds a window synchronously; only valid before start()
    Dispatcher createWindow(const std::string& title = "main", const std::string& label = "main") {
        PendingWindow pending(WindowBuilder().title(title), WebviewAttributes(), label);
        return runtime->createWindow(std::move(pending)).dispatcher;
    }

    void start() {
        Runtime* r = runtime.get();
        finished = std::async(std::launch::async, [r]() { r->run(); });
    }

    // True once run() has returned
    bool stopped(std::chrono::milliseconds timeout = TEST_TIMEOUT) {
        return finished.wait_for(timeout) == std::future_status::ready;
    }

    // Returns once everything queued so far, and every event that work queued in turn,
    // has been processed. The loop must still be running.
    void drain() {
        for (int round = 0; round < 2; round++) {
            std::future<std::optional<RpcResponse>> done = controller->simulateRpc(0, RpcRequest{"drain", {}});
            REQUIRE(done.wait_for(TEST_TIMEOUT) == std::future_status::ready);
            done.get();
        }
    }

    HeadlessWindowState state(WindowId id) const {
        std::optional<HeadlessWindowState> window = controller->windowState(id);
        REQUIRE(window);
        return *window;
    }
};

// Thread-safe log of values seen by listeners on the loop thread
template<typename T>
class Recorder {
public:
    void push(const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.push_back(value);
    }

    std::vector<T> items() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<T> items_;
};

// Smallest byte sequence the headless icon decoder accepts: signature and IHDR header
inline std::vector<uint8_t> pngHeader(uint32_t width, uint32_t height) {
    std::vector<uint8_t> bytes = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n',
                                  0, 0, 0, 13, 'I', 'H', 'D', 'R'};
    for (uint32_t value : {width, height}) {
        bytes.push_back(static_cast<uint8_t>(value >> 24));
        bytes.push_back(static_cast<uint8_t>(value >> 16));
        bytes.push_back(static_cast<uint8_t>(value >> 8));
        bytes.push_back(static_cast<uint8_t>(value));
    }
    return bytes;
}

class ErrorKindMatcher : public Catch::MatcherBase<Error> {
public:
    explicit ErrorKindMatcher(ErrorKind kind) : kind_(kind) {}

    bool match(const Error& error) const override {
        return error.kind() == kind_;
    }

    std::string describe() const override {
        return std::string("has kind \"") + errorKindToString(kind_) + "\"";
    }

private:
    ErrorKind kind_;
};

inline ErrorKindMatcher HasKind(ErrorKind kind) {
    return ErrorKindMatcher(kind);
}

} // namespace webshell

#endif // WEBSHELL_TEST_SUPPORT_H
