/**
 * @file counting_resource.hpp
 * @brief Memory resources that track or fail allocations, for tests.
 *
 * @authors resp3 contributors
 */

#ifndef RESP3_TESTS_COUNTING_RESOURCE_HPP
#define RESP3_TESTS_COUNTING_RESOURCE_HPP

#include <cstddef>
#include <memory_resource>
#include <new>

namespace resp3::test {

/**
 * @brief Forwards to the new/delete resource and counts live bytes.
 */
class CountingResource : public std::pmr::memory_resource {
public:
    std::size_t outstanding() const noexcept {
        return outstanding_;
    }

    std::size_t allocations() const noexcept {
        return allocations_;
    }

private:
    void* do_allocate(std::size_t bytes, std::size_t alignment) override {
        void* p = upstream_->allocate(bytes, alignment);
        outstanding_ += bytes;
        ++allocations_;
        return p;
    }

    void do_deallocate(void* p, std::size_t bytes, std::size_t alignment) override {
        outstanding_ -= bytes;
        upstream_->deallocate(p, bytes, alignment);
    }

    bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override {
        return this == &other;
    }

    std::pmr::memory_resource* upstream_ = std::pmr::new_delete_resource();
    std::size_t outstanding_ = 0;
    std::size_t allocations_ = 0;
};

/**
 * @brief Counting resource that throws std::bad_alloc once a budget of
 *        allocations is used up.
 */
class FailingResource : public std::pmr::memory_resource {
public:
    explicit FailingResource(std::size_t budget) noexcept : budget_(budget) {}

    std::size_t outstanding() const noexcept {
        return counter_.outstanding();
    }

private:
    void* do_allocate(std::size_t bytes, std::size_t alignment) override {
        if (budget_ == 0) {
            throw std::bad_alloc();
        }
        --budget_;
        return static_cast<std::pmr::memory_resource&>(counter_).allocate(bytes, alignment);
    }

    void do_deallocate(void* p, std::size_t bytes, std::size_t alignment) override {
        static_cast<std::pmr::memory_resource&>(counter_).deallocate(p, bytes, alignment);
    }

    bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override {
        return this == &other;
    }

    CountingResource counter_;
    std::size_t budget_;
};

} // namespace resp3::test

#endif // RESP3_TESTS_COUNTING_RESOURCE_HPP
