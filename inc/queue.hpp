//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef STAMPEDE_DEFERRED_EXECUTOR_QUEUE
#define STAMPEDE_DEFERRED_EXECUTOR_QUEUE

#include <cstddef>
#include <memory>
#include <sstream>
#include <iterator>
#include <utility>

#include "utility.hpp"
#include "logging.hpp"

namespace sde {

/**
 @brief a singly linked FIFO queue

 Holds the backlog of an `sde::executor` and the mailbox of an `sde::loop`.

 Design Aims:
 - strict FIFO: push on tail, pop from head
 - fast append
 - fast whole-queue concatenation
 - size tracking
 - front-to-back iteration without popping

 Design Limitations:
 - no arbitrary insertion or erasure
 - not copiable

 Used over `std::deque<T>` because a backlog can be handed over in constant
 time with `concatenate()`, which the `sde::loop` worker uses to collect an
 entire mailbox under one lock acquisition.
 */
template <typename T>
struct queue : public printable {
    using value_type = T;

private:
    struct node {
        template <typename... As>
        node(As&&... as) : value(std::forward<As>(as)...), next(nullptr) { }

        T value;
        node* next;
    };

public:
    struct iterator : public printable {
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = T*;
        using reference = T&;

        iterator() : node_(nullptr) { }
        iterator(const iterator& rhs) : node_(rhs.node_) { }

        static inline std::string info_name() {
            return sde::queue<T>::info_name() + "::iterator";
        }

        inline std::string name() const { return iterator::info_name(); }

        inline iterator& operator=(const iterator& rhs) {
            node_ = rhs.node_;
            return *this;
        }

        inline bool operator==(const iterator& rhs) const {
            return node_ == rhs.node_;
        }

        inline bool operator!=(const iterator& rhs) const {
            return !(*this == rhs);
        }

        inline T& operator*() const { return node_->value; }
        inline T* operator->() const { return &(node_->value); }

        inline iterator& operator++() {
            node_ = node_->next;
            return *this;
        }

        inline iterator operator++(int) {
            iterator old(*this);
            node_ = node_->next;
            return old;
        }

    private:
        iterator(node* n) : node_(n) { }

        node* node_;
        friend struct sde::queue<T>;
    };

    queue() { SDE_MIN_CONSTRUCTOR(); }
    queue(const queue<T>&) = delete;

    queue(queue<T>&& rhs) {
        SDE_MIN_CONSTRUCTOR(rhs);
        swap_(rhs);
    }

    virtual ~queue() {
        SDE_MIN_DESTRUCTOR();
        clear();
    }

    queue<T>& operator=(const queue<T>&) = delete;

    inline queue<T>& operator=(queue<T>&& rhs) {
        SDE_MIN_METHOD_ENTER("operator=", rhs);
        clear();
        swap_(rhs);
        return *this;
    }

    static inline std::string info_name() {
        return type::templatize<T>("sde::queue");
    }

    inline std::string name() const { return queue<T>::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "size:" << size_;
        return ss.str();
    }

    inline iterator begin() const { return { head_ }; }
    inline iterator end() const { return {}; }

    /// @return the current length of the queue
    inline size_t size() const {
        SDE_TRACE_METHOD_ENTER("size");
        return size_;
    }

    /// @return true if empty, else false
    inline bool empty() const {
        SDE_TRACE_METHOD_ENTER("empty");
        return !size_;
    }

    /// @return a reference to the front of the queue
    inline T& front() {
        SDE_TRACE_METHOD_ENTER("front");
        return head_->value;
    }

    /// @return a reference to the back of the queue
    inline T& back() {
        SDE_TRACE_METHOD_ENTER("back");
        return tail_->value;
    }

    /// emplace an element on the back of the queue
    template <typename... As>
    inline void emplace_back(As&&... as) {
        SDE_TRACE_METHOD_ENTER("emplace_back");
        node* next = allocator_.allocate(1);

        try {
            new(next) node(std::forward<As>(as)...);
        } catch(...) {
            // construction failed, no node to link
            allocator_.deallocate(next, 1);
            throw;
        }

        if(size_) [[likely]] {
            tail_->next = next;
            tail_ = next;
        } else [[unlikely]] {
            head_ = next;
            tail_ = next;
        }

        ++size_;
    }

    inline void push_back(const T& t) { emplace_back(t); }
    inline void push_back(T&& t) { emplace_back(std::move(t)); }

    /// pop off the front of the queue
    inline void pop() {
        SDE_TRACE_METHOD_ENTER("pop");
        node* old = head_;
        head_ = head_->next;

        if(!head_) [[unlikely]] { tail_ = nullptr; }

        old->~node();
        allocator_.deallocate(old, 1);
        --size_;
    }

    /// destroy every element
    inline void clear() {
        while(size_) [[likely]] { pop(); }
    }

    /**
     @brief steal the elements of the argument queue and append them to the end

     The argument queue is empty but valid after this call.
     */
    inline void concatenate(queue<T>& rhs) {
        SDE_MIN_METHOD_ENTER("concatenate", rhs);
        if(rhs.size_) {
            if(size_) {
                tail_->next = rhs.head_;
                tail_ = rhs.tail_;
                size_ += rhs.size_;
                rhs.head_ = nullptr;
                rhs.tail_ = nullptr;
                rhs.size_ = 0;
            } else {
                swap_(rhs);
            }
        }
    }

private:
    inline void swap_(queue<T>& rhs) {
        std::swap(head_, rhs.head_);
        std::swap(tail_, rhs.tail_);
        std::swap(size_, rhs.size_);
    }

    node* head_ = nullptr;
    node* tail_ = nullptr;
    size_t size_ = 0;
    std::allocator<node> allocator_;
};

}

#endif
