#pragma once

// Standard
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

// seqan3
#include <seqan3/contrib/parallel/buffer_queue.hpp>
#include <seqan3/core/range/detail/adaptor_from_functor.hpp>
#include <seqan3/io/sam_file/input.hpp>

// Internal
#include "SamRecord.hpp"
#include "UmiCorrector.hpp"

namespace pipelines::correct {

/**
 * Raw UMI counts of one run of consecutive records sharing a reference. Records without
 * reference form their own run.
 */
struct ReferenceUmiCounts {
    std::optional<int32_t> referenceID;
    BarcodeUmiCounts counts;
    size_t recordCount{0};
};

/**
 * Counts the raw UMIs of consecutive records of a coordinate sorted alignment file per reference
 * and hands the counts to any number of consumers through a bounded queue. A producer thread
 * reads the records and keeps at most bufferSize references of counts ahead; the records
 * themselves are not kept.
 *
 * Errors raised while reading are kept and rethrown by rethrowProducerError() once the consumers
 * are done.
 */
template <std::ranges::range urng_t>
class AsyncReferenceUmiCountBufferView
    : public std::ranges::view_interface<AsyncReferenceUmiCountBufferView<urng_t>> {
   private:
    static_assert(std::ranges::input_range<urng_t>,
                  "The range parameter to AsyncReferenceUmiCountBufferView must be at least a "
                  "std::ranges::input_range.");
    static_assert(std::ranges::view<urng_t>,
                  "The range parameter to AsyncReferenceUmiCountBufferView must model "
                  "std::ranges::view.");
    static_assert(std::same_as<urng_t, std::ranges::ref_view<dataTypes::SamInput>>,
                  "Range type must be a reference to an alignment file input.");

    using record_type = dataTypes::SamInput::value_type;
    using group_type = ReferenceUmiCounts;
    using queue_type = seqan3::contrib::fixed_buffer_queue<group_type>;

    struct state {
        urng_t urange;

        queue_type buffer;

        std::thread producer;

        std::mutex errorMutex;
        std::exception_ptr producerError;
    };

    std::shared_ptr<state> statePtr = nullptr;

    class iterator {
        queue_type* bufferPtr = nullptr;

        mutable group_type cached_value;

        bool at_end = false;

       public:
        using difference_type = std::ptrdiff_t;
        using value_type = group_type;
        using pointer = group_type*;
        using reference = group_type&;
        using iterator_category = std::input_iterator_tag;
        using iterator_concept = iterator_category;

        iterator() = default;
        iterator(iterator const& rhs) = default;
        iterator(iterator&& rhs) = default;
        iterator& operator=(iterator const& rhs) = default;
        iterator& operator=(iterator&& rhs) = default;
        ~iterator() noexcept = default;

        explicit iterator(queue_type& buffer) noexcept : bufferPtr{&buffer} { ++(*this); }

        reference operator*() const noexcept { return cached_value; }

        pointer operator->() const noexcept { return std::addressof(cached_value); }

        iterator& operator++() noexcept {
            if (at_end || bufferPtr == nullptr) {
                at_end = true;
                return *this;
            }

            if (bufferPtr->wait_pop(cached_value) == seqan3::contrib::queue_op_status::closed) {
                at_end = true;
            }

            return *this;
        }

        void operator++(int) noexcept { ++(*this); }

        friend constexpr bool operator==(iterator const& lhs,
                                         std::default_sentinel_t const&) noexcept {
            return lhs.at_end;
        }
    };

   public:
    AsyncReferenceUmiCountBufferView(urng_t _urng, size_t const bufferSize) {
        auto deleter = [](state* p) {
            if (p != nullptr) {
                p->buffer.close();
                p->producer.join();
                delete p;
            }
        };

        statePtr = std::shared_ptr<state>(
            new state{std::move(_urng), queue_type{bufferSize}, std::thread{}, {}, nullptr},
            deleter);

        auto runner = [&state = *statePtr]() {
            try {
                auto recordIter = state.urange.begin();

                if (recordIter == state.urange.end()) {
                    state.buffer.close();
                    return;
                }

                group_type umiCounts{.referenceID = (*recordIter).reference_id()};

                for (; recordIter != state.urange.end(); ++recordIter) {
                    auto&& record = *recordIter;
                    if (umiCounts.referenceID != record.reference_id()) {
                        const auto status = state.buffer.wait_push(std::move(umiCounts));
                        if (status == seqan3::contrib::queue_op_status::closed) {
                            return;
                        }
                        umiCounts = group_type{.referenceID = record.reference_id()};
                    }

                    UmiCorrector::countUmi(umiCounts.counts, record);
                    ++umiCounts.recordCount;
                }

                if (!state.buffer.is_closed()) {
                    state.buffer.wait_push(std::move(umiCounts));
                }
            } catch (const std::exception&) {
                std::lock_guard<std::mutex> lock(state.errorMutex);
                state.producerError = std::current_exception();
            }

            state.buffer.close();
        };

        statePtr->producer = std::thread{runner};
    }

    template <typename other_urange_t>
        requires(!std::same_as<std::remove_cvref_t<other_urange_t>,
                               AsyncReferenceUmiCountBufferView>) &&
                std::ranges::viewable_range<other_urange_t> &&
                std::constructible_from<
                    urng_t, std::ranges::ref_view<std::remove_reference_t<other_urange_t>>>
    AsyncReferenceUmiCountBufferView(other_urange_t&& _urng, size_t const bufferSize)
        : AsyncReferenceUmiCountBufferView{std::views::all(_urng), bufferSize} {}

    iterator begin() {
        if (statePtr == nullptr) {
            throw std::logic_error("AsyncReferenceUmiCountBufferView used after move");
        }
        return iterator{statePtr->buffer};
    }

    iterator begin() const = delete;

    std::default_sentinel_t end() { return std::default_sentinel; }

    std::default_sentinel_t end() const = delete;

    /**
     * Rethrows an error of the reading thread. Call after all consumers finished.
     */
    void rethrowProducerError() {
        std::lock_guard<std::mutex> lock(statePtr->errorMutex);
        if (statePtr->producerError) {
            std::rethrow_exception(statePtr->producerError);
        }
    }
};

template <std::ranges::viewable_range urng_t>
AsyncReferenceUmiCountBufferView(urng_t&&, size_t const buffer_size)
    -> AsyncReferenceUmiCountBufferView<std::views::all_t<urng_t>>;

struct AsyncReferenceUmiCountBufferViewFn {
    constexpr auto operator()(size_t const bufferSize) const {
        return seqan3::detail::adaptor_from_functor{*this, bufferSize};
    }

    template <std::ranges::range urng_t>
    constexpr auto operator()(urng_t&& urange, size_t const bufferSize) const {
        static_assert(std::ranges::viewable_range<urng_t>,
                      "The range parameter to AsyncReferenceUmiCountBuffer cannot be a temporary of "
                      "a non-view range.");

        if (bufferSize == 0) {
            throw std::invalid_argument{
                "The bufferSize parameter to AsyncReferenceUmiCountBuffer must be > 0."};
        }

        return AsyncReferenceUmiCountBufferView{std::forward<urng_t>(urange), bufferSize};
    }
};

inline constexpr auto AsyncReferenceUmiCountBuffer = AsyncReferenceUmiCountBufferViewFn{};

using AsyncReferenceUmiCountBufferType =
    AsyncReferenceUmiCountBufferView<std::ranges::ref_view<dataTypes::SamInput>>;

}  // namespace pipelines::correct
