// Copyright (C) 2025 Tycho Softworks.
// This code is licensed under MIT license.

#ifndef TANDEM_LIST_HPP_
#define TANDEM_LIST_HPP_

#include <memory>
#include <vector>
#include <string>
#include <sstream>
#include <utility>
#include <initializer_list>
#include <stdexcept>

namespace tandem {
template <typename T>
struct list_node;

template <typename T>
using node_ptr = std::unique_ptr<list_node<T>>;

template <typename T>
struct list_node final {
    T data;
    node_ptr<T> next;

    explicit list_node(const T& value) : data(value) {}
    list_node(const T& value, node_ptr<T> link) : data(value), next(std::move(link)) {}
    list_node(const list_node&) = delete;
    auto operator=(const list_node&) -> auto& = delete;

    // unlink iteratively so long chains do not recurse on destruction
    ~list_node() {
        auto link = std::move(next);
        while(link)
            link = std::move(link->next);
    }
};

template <typename T, typename Container = std::initializer_list<T>>
auto make_chain(const Container& values) {
    node_ptr<T> head;
    auto *tail = &head;
    for(const auto& value : values) {
        *tail = std::make_unique<list_node<T>>(value);
        tail = &(*tail)->next;
    }
    return head;
}

template <typename T>
auto chain_size(const node_ptr<T>& head) {
    std::size_t count = 0;
    for(auto node = head.get(); node != nullptr; node = node->next.get())
        ++count;
    return count;
}

template <typename T>
auto to_vector(const node_ptr<T>& head) {
    std::vector<T> result;
    for(auto node = head.get(); node != nullptr; node = node->next.get())
        result.push_back(node->data);
    return result;
}

template <typename T>
auto to_string(const node_ptr<T>& head) {
    std::ostringstream out;
    for(auto node = head.get(); node != nullptr; node = node->next.get())
        out << node->data << " -> ";
    out << "nil";
    return out.str();
}

// Removes the n-th node counted from the tail (n=1 is the last node). The
// caller gives up the chain and gets back its new head. A missing head, a
// non-positive n, or an n past the length hands the chain back untouched.
template <typename T>
auto remove_nth_from_end(node_ptr<T> head, int n) -> node_ptr<T> {
    if(!head || n <= 0)
        return head;

    // cursors address links, so the sentinel link stands in for a dummy node
    node_ptr<T> sentinel = std::move(head);
    auto *lead = &sentinel;
    auto *trail = &sentinel;

    for(auto step = 0; step < n; ++step) {
        if(!*lead)
            return sentinel;
        lead = &(*lead)->next;
    }

    while(*lead) {
        lead = &(*lead)->next;
        trail = &(*trail)->next;
    }

    *trail = std::move((*trail)->next);
    return sentinel;
}

template <typename T>
class slist {
public:
    using value_type = T;
    using reference = T&;
    using const_reference = const T&;
    using size_type = std::size_t;

    class iterator {
    public:
        explicit iterator(list_node<T> *node) : current_(node) {}

        auto operator*() -> auto& {
            return current_->data;
        }

        auto operator++() -> auto& {
            if(current_)
                current_ = current_->next.get();
            return *this;
        }

        auto operator==(const iterator& other) const {
            return current_ == other.current_;
        }

        auto operator!=(const iterator& other) const {
            return current_ != other.current_;
        }

    private:
        list_node<T> *current_{nullptr};
    };

    class const_iterator {
    public:
        explicit const_iterator(const list_node<T> *node) : current_(node) {}

        auto operator*() const -> auto& {
            return current_->data;
        }

        auto operator++() -> auto& {
            if(current_)
                current_ = current_->next.get();
            return *this;
        }

        auto operator==(const const_iterator& other) const {
            return current_ == other.current_;
        }

        auto operator!=(const const_iterator& other) const {
            return current_ != other.current_;
        }

    private:
        const list_node<T> *current_{nullptr};
    };

    slist() = default;
    slist(const slist&) = delete;
    slist(slist&&) noexcept = default;
    explicit slist(node_ptr<T> head) : head_(std::move(head)) {}
    slist(std::initializer_list<T> list) : head_(make_chain<T>(list)) {}

    auto operator=(const slist&) -> auto& = delete;
    auto operator=(slist&&) noexcept -> slist& = default;

    explicit operator bool() const {
        return !empty();
    }

    auto operator!() const {
        return empty();
    }

    void push_front(const T& value) {
        head_ = std::make_unique<list_node<T>>(value, std::move(head_));
    }

    void push_back(const T& value) {
        auto *link = &head_;
        while(*link)
            link = &(*link)->next;
        *link = std::make_unique<list_node<T>>(value);
    }

    auto front() -> auto& {
        if(head_)
            return head_->data;
        throw std::runtime_error("List is empty");
    }

    auto back() -> auto& {
        if(!head_)
            throw std::runtime_error("List is empty");
        auto node = head_.get();
        while(node->next)
            node = node->next.get();
        return node->data;
    }

    auto empty() const {
        return head_ == nullptr;
    }

    auto size() const {
        return chain_size(head_);
    }

    void clear() {
        head_.reset();
    }

    auto remove_from_end(int n) -> auto& {
        head_ = remove_nth_from_end(std::move(head_), n);
        return *this;
    }

    auto release() {
        return std::move(head_);
    }

    auto head() const -> const node_ptr<T>& {
        return head_;
    }

    auto values() const {
        return to_vector(head_);
    }

    auto begin() {
        return iterator(head_.get());
    }

    auto end() {
        return iterator(nullptr);
    }

    auto begin() const {
        return const_iterator(head_.get());
    }

    auto end() const {
        return const_iterator(nullptr);
    }

private:
    node_ptr<T> head_;
};
} // end namespace
#endif
