#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <memory_resource>
#include <string>
#include <thread>
#include <vector>

#include "store/buffer_cell.hpp"

using knxbridge::SubscriptionError;
using knxbridge::store::BufferCell;
using knxbridge::store::BufferCfg;
using knxbridge::store::BufferKind;
using knxbridge::store::BufferReader;

namespace {

struct Sample {
    int value = 0;
    std::string label;
};

std::shared_ptr<BufferCell<Sample>> make_cell(const BufferCfg &cfg) {
    return std::make_shared<BufferCell<Sample>>(cfg, std::pmr::new_delete_resource());
}

} // namespace

int main() {
    {
        auto cell = make_cell(BufferCfg::latest());
        Sample out;
        assert(cell->try_get(out) == SubscriptionError::Empty);

        assert(cell->write(Sample{1, "a"}));
        assert(cell->write(Sample{2, "b"}));
        assert(cell->try_get(out) == SubscriptionError::None);
        assert(out.value == 2 && out.label == "b");
        assert(cell->get(out) == SubscriptionError::None);
        assert(out.value == 2);

        auto stats = cell->statistics();
        assert(stats.kind == BufferKind::Latest);
        assert(stats.capacity == 1);
        assert(stats.writes == 2);
    }

    {
        // Readers only see writes made after they subscribed; missed latest
        // values coalesce.
        auto cell = make_cell(BufferCfg::latest());
        cell->write(Sample{1, ""});

        std::unique_ptr<BufferReader<Sample>> reader;
        assert(cell->subscribe(reader) == SubscriptionError::None);
        Sample out;
        assert(reader->try_next(out) == SubscriptionError::Empty);

        cell->write(Sample{2, ""});
        cell->write(Sample{3, ""});
        cell->write(Sample{4, ""});
        assert(reader->try_next(out) == SubscriptionError::None);
        assert(out.value == 4);
        assert(reader->skipped() == 2);
        assert(reader->try_next(out) == SubscriptionError::Empty);
    }

    {
        // Ring of 3 with 5 writes: a fresh reader sees only the 3 newest.
        auto cell = make_cell(BufferCfg::spmc_ring(3));
        std::unique_ptr<BufferReader<Sample>> slow;
        std::unique_ptr<BufferReader<Sample>> fast;
        assert(cell->subscribe(slow) == SubscriptionError::None);
        assert(cell->subscribe(fast) == SubscriptionError::None);

        Sample out;
        cell->write(Sample{1, ""});
        assert(fast->try_next(out) == SubscriptionError::None);
        assert(out.value == 1);

        for (int i = 2; i <= 5; ++i) {
            assert(cell->write(Sample{i, ""}));
        }

        std::vector<int> seen;
        while (slow->try_next(out) == SubscriptionError::None) {
            seen.push_back(out.value);
        }
        assert((seen == std::vector<int>{3, 4, 5}));
        assert(slow->skipped() == 2);

        // The other cursor is independent and lost one entry.
        seen.clear();
        while (fast->try_next(out) == SubscriptionError::None) {
            seen.push_back(out.value);
        }
        assert((seen == std::vector<int>{3, 4, 5}));
        assert(fast->skipped() == 1);

        assert(cell->try_get(out) == SubscriptionError::None);
        assert(out.value == 5);
    }

    {
        // Ring readers that keep up get every value in order.
        auto cell = make_cell(BufferCfg::spmc_ring(4));
        std::unique_ptr<BufferReader<Sample>> reader;
        assert(cell->subscribe(reader) == SubscriptionError::None);
        Sample out;
        for (int i = 0; i < 10; ++i) {
            cell->write(Sample{i, ""});
            assert(reader->next(out) == SubscriptionError::None);
            assert(out.value == i);
        }
        assert(reader->skipped() == 0);
    }

    {
        auto cell = make_cell(BufferCfg::latest(2));
        std::unique_ptr<BufferReader<Sample>> first;
        std::unique_ptr<BufferReader<Sample>> second;
        std::unique_ptr<BufferReader<Sample>> third;
        assert(cell->subscribe(first) == SubscriptionError::None);
        assert(cell->subscribe(second) == SubscriptionError::None);
        assert(cell->subscribe(third) == SubscriptionError::SubscriberLimit);
        assert(!third);
        assert(cell->statistics().subscribers == 2);

        // Dropping a reader frees its slot.
        first.reset();
        assert(cell->statistics().subscribers == 1);
        assert(cell->subscribe(third) == SubscriptionError::None);
    }

    {
        // close() wakes blocked readers and getters right away.
        auto cell = make_cell(BufferCfg::latest());
        std::unique_ptr<BufferReader<Sample>> reader;
        assert(cell->subscribe(reader) == SubscriptionError::None);

        std::atomic<int> closed_seen{0};
        std::thread blocked_reader([&]() {
            Sample out;
            if (reader->next(out) == SubscriptionError::Closed) {
                ++closed_seen;
            }
        });
        std::thread blocked_getter([&]() {
            Sample out;
            if (cell->get(out) == SubscriptionError::Closed) {
                ++closed_seen;
            }
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        cell->close();
        blocked_reader.join();
        blocked_getter.join();
        assert(closed_seen == 2);

        assert(!cell->write(Sample{1, ""}));
        std::unique_ptr<BufferReader<Sample>> late;
        assert(cell->subscribe(late) == SubscriptionError::Closed);
        assert(cell->statistics().closed);
    }

    {
        // A blocked reader wakes on the next write.
        auto cell = make_cell(BufferCfg::spmc_ring(8));
        std::unique_ptr<BufferReader<Sample>> reader;
        assert(cell->subscribe(reader) == SubscriptionError::None);

        std::atomic<int> received{-1};
        std::thread consumer([&]() {
            Sample out;
            if (reader->next(out) == SubscriptionError::None) {
                received = out.value;
            }
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        cell->write(Sample{42, "x"});
        consumer.join();
        assert(received == 42);
    }

    {
        assert(!BufferCfg::spmc_ring(0).valid());
        assert(!BufferCfg::latest(0).valid());
        assert(!(BufferCfg{BufferKind::Latest, 4, 1}).valid());
        assert(BufferCfg::spmc_ring(50).valid());
    }

    return 0;
}
