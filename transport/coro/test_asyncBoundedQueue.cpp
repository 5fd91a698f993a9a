//
// AsyncBoundedQueue tests
//
// Covers the channel contract the relay depends on:
// 1. A full queue suspends the producer instead of dropping or growing
// 2. FIFO order across suspensions
// 3. Close lets the consumer drain, then pops yield nothing
// 4. Pushing onto a closed queue fails with relay::errc::queue_closed
//

#undef NDEBUG
#include "transport/coro/AsyncBoundedQueue.hpp"
#include "transport/coro/CoroTask.hpp"
#include "transport/coro/coroIoContext.hpp"
#include "relayErrors.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <system_error>
#include <vector>

using transport::AsyncBoundedQueue;
using transport::CoroIoContext;

namespace {

Task<void> produce(AsyncBoundedQueue<int>& queue, int count, int& pushed) {
    for (int i = 0; i < count; ++i) {
        co_await queue.async_push(i);
        ++pushed;
    }
    queue.close();
}

Task<void> consume(AsyncBoundedQueue<int>& queue, std::vector<int>& out, std::size_t& max_seen) {
    for (;;) {
        if (queue.size() > max_seen) max_seen = queue.size();
        auto item = co_await queue.async_pop();
        if (!item) break;
        out.push_back(*item);
    }
}

Task<std::error_code> push_expecting_failure(AsyncBoundedQueue<int>& queue) {
    try {
        co_await queue.async_push(7);
    } catch (const std::system_error& e) {
        co_return e.code();
    }
    co_return std::error_code{};
}

} // namespace

//==============================================================================
// Test 1: Full queue suspends the producer
//==============================================================================
void test_producer_suspends_when_full() {
    std::cout << "=== Test 1: Producer suspends when full ===" << std::endl;
    auto ctx = std::make_shared<CoroIoContext>();
    ctx->set_poll_interval(std::chrono::milliseconds(1));
    AsyncBoundedQueue<int> queue(2, ctx);

    int pushed = 0;
    auto producer = produce(queue, 5, pushed);

    // Tasks run eagerly up to the first suspension: two pushes fit, the third parks.
    assert(pushed == 2);
    assert(!producer.done());
    assert(queue.size() == 2);

    std::vector<int> received;
    std::size_t max_seen = 0;
    auto consumer = consume(queue, received, max_seen);

    ctx->run_until([&]() { return producer.done() && consumer.done(); });

    assert(pushed == 5);
    assert((received == std::vector<int>{0, 1, 2, 3, 4}));
    assert(max_seen <= queue.capacity());
    std::cout << "Received " << received.size() << " items in order, max length " << max_seen << std::endl;
    std::cout << "Scheduler: " << ctx->format_statistics() << std::endl << std::endl;
}

//==============================================================================
// Test 2: Close drains remaining items, then signals the end
//==============================================================================
void test_close_then_drain() {
    std::cout << "=== Test 2: Close then drain ===" << std::endl;
    auto ctx = std::make_shared<CoroIoContext>();
    AsyncBoundedQueue<int> queue(4, ctx);

    std::error_code ec;
    int a = 10, b = 11;
    assert(queue.try_push(a, ec) && !ec);
    assert(queue.try_push(b, ec) && !ec);
    queue.close();
    assert(queue.closed());

    std::optional<int> out;
    assert(queue.try_pop(out) && out && *out == 10);
    assert(queue.try_pop(out) && out && *out == 11);
    assert(queue.try_pop(out) && !out);
    assert(queue.try_pop(out) && !out); // stays ended
    std::cout << "Drained buffered items after close" << std::endl << std::endl;
}

//==============================================================================
// Test 3: A waiting consumer is released by close
//==============================================================================
void test_close_releases_waiting_consumer() {
    std::cout << "=== Test 3: Close releases waiting consumer ===" << std::endl;
    auto ctx = std::make_shared<CoroIoContext>();
    AsyncBoundedQueue<int> queue(1, ctx);

    std::vector<int> received;
    std::size_t max_seen = 0;
    auto consumer = consume(queue, received, max_seen);
    assert(!consumer.done());

    queue.close();
    ctx->run_until([&]() { return consumer.done(); });
    assert(received.empty());
    std::cout << "Consumer finished with no items" << std::endl << std::endl;
}

//==============================================================================
// Test 4: Push after close is an error, not a silent drop
//==============================================================================
void test_push_after_close() {
    std::cout << "=== Test 4: Push after close ===" << std::endl;
    auto ctx = std::make_shared<CoroIoContext>();
    AsyncBoundedQueue<int> queue(1, ctx);
    queue.close();

    auto task = push_expecting_failure(queue);
    assert(task.done());
    auto ec = task.get_result();
    assert(ec == relay::errc::queue_closed);
    assert(queue.empty());
    std::cout << "Push failed with: " << ec.message() << std::endl << std::endl;
}

int main() {
    test_producer_suspends_when_full();
    test_close_then_drain();
    test_close_releases_waiting_consumer();
    test_push_after_close();
    std::cout << "All AsyncBoundedQueue tests passed" << std::endl;
    return 0;
}
