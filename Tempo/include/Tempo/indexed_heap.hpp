#pragma once

#include <cassert>
#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Tempo {

// ============================================================
// Backing containers
// ============================================================

/**
 * Storage a Heap sifts over.
 *
 * The heap never touches elements directly: it only compares and swaps slots
 * and grows or shrinks the tail. That keeps bookkeeping such as the id->index
 * table of IndexedContainer in the container, next to the swap that has to
 * maintain it.
 */
template<typename C>
concept HeapContainer = requires(C& c, const C& cc, std::size_t i, typename C::value_type x) {
    typename C::value_type;
    { cc.size() } -> std::convertible_to<std::size_t>;
    { cc.less(i, i) } -> std::convertible_to<bool>;
    { cc.get(i) } -> std::convertible_to<const typename C::value_type&>;
    c.swap(i, i);
    c.pushBack(std::move(x));
    { c.popBack() } -> std::same_as<typename C::value_type>;
};

/**
 * Plain vector storage ordered by a comparator.
 */
template<typename T, typename Less = std::less<T>>
class VectorContainer {
public:
    using value_type = T;

    VectorContainer() = default;
    explicit VectorContainer(std::vector<T> elems, Less less = Less())
        : m_elems(std::move(elems)), m_less(std::move(less)) {}

    std::size_t size() const { return m_elems.size(); }

    const T& get(std::size_t i) const { return m_elems[i]; }
    T& get(std::size_t i) { return m_elems[i]; }

    bool less(std::size_t i, std::size_t j) const {
        return m_less(m_elems[i], m_elems[j]);
    }

    void swap(std::size_t i, std::size_t j) {
        std::swap(m_elems[i], m_elems[j]);
    }

    void pushBack(T x) {
        m_elems.push_back(std::move(x));
    }

    T popBack() {
        T x = std::move(m_elems.back());
        m_elems.pop_back();
        return x;
    }

    void clear() { m_elems.clear(); }

protected:
    std::vector<T> m_elems;
    Less m_less;
};

/**
 * Vector storage that also tracks where each element currently sits.
 *
 * KeyOf extracts a stable identity from an element. The identity is read-only
 * as far as the container is concerned; only the side table changes when
 * elements move.
 */
template<typename T, typename Key, typename KeyOf, typename Less = std::less<T>>
class IndexedContainer : public VectorContainer<T, Less> {
public:
    using Base = VectorContainer<T, Less>;
    using value_type = T;

    IndexedContainer() = default;
    explicit IndexedContainer(std::vector<T> elems, Less less = Less(), KeyOf keyOf = KeyOf())
        : Base(std::move(elems), std::move(less)), m_keyOf(std::move(keyOf)) {
        for (std::size_t i = 0; i < this->m_elems.size(); ++i) {
            m_indices[m_keyOf(this->m_elems[i])] = i;
        }
    }

    void swap(std::size_t i, std::size_t j) {
        Base::swap(i, j);
        m_indices[m_keyOf(this->m_elems[i])] = i;
        m_indices[m_keyOf(this->m_elems[j])] = j;
    }

    void pushBack(T x) {
        m_indices[m_keyOf(x)] = this->m_elems.size();
        Base::pushBack(std::move(x));
    }

    T popBack() {
        T x = Base::popBack();
        m_indices.erase(m_keyOf(x));
        return x;
    }

    void clear() {
        Base::clear();
        m_indices.clear();
    }

    // Current slot of the element with this identity, if it is stored.
    std::optional<std::size_t> indexOf(const Key& key) const {
        auto it = m_indices.find(key);
        if (it == m_indices.end()) {
            return std::nullopt;
        }
        assert(it->second < this->m_elems.size());
        assert(m_keyOf(this->m_elems[it->second]) == key);
        return it->second;
    }

    bool contains(const Key& key) const {
        return m_indices.find(key) != m_indices.end();
    }

private:
    KeyOf m_keyOf;
    std::unordered_map<Key, std::size_t> m_indices;
};

// ============================================================
// Heap
// ============================================================

/**
 * Binary min-heap over any HeapContainer.
 *
 * The minimum according to the container's less() sits at slot 0. Every
 * mutation goes through the container's swap/pushBack/popBack so indexed
 * containers stay in sync.
 *
 * Example:
 *     Heap<VectorContainer<int>> heap;
 *     heap.push(3);
 *     heap.push(1);
 *     int smallest = heap.pop(); // 1
 */
template<HeapContainer C>
class Heap {
public:
    using value_type = typename C::value_type;

    Heap() = default;
    explicit Heap(C container) : m_container(std::move(container)) {
        init();
    }

    // Establish the heap property over whatever the container already holds.
    void init() {
        std::size_t n = m_container.size();
        for (std::size_t i = n / 2; i-- > 0;) {
            down(i, n);
        }
    }

    std::size_t size() const { return m_container.size(); }
    bool empty() const { return m_container.size() == 0; }

    const value_type& top() const {
        if (empty()) {
            throw std::out_of_range("Heap::top() on empty heap");
        }
        return m_container.get(0);
    }

    void push(value_type x) {
        m_container.pushBack(std::move(x));
        up(m_container.size() - 1);
    }

    value_type pop() {
        if (empty()) {
            throw std::out_of_range("Heap::pop() on empty heap");
        }
        std::size_t n = m_container.size() - 1;
        m_container.swap(0, n);
        down(0, n);
        return m_container.popBack();
    }

    value_type removeAt(std::size_t i) {
        if (i >= m_container.size()) {
            throw std::out_of_range("Heap::removeAt() index out of range");
        }
        std::size_t n = m_container.size() - 1;
        if (n != i) {
            m_container.swap(i, n);
            if (!down(i, n)) {
                up(i);
            }
        }
        return m_container.popBack();
    }

    // Restore ordering after the element at i changed its key in place.
    void fix(std::size_t i) {
        if (i >= m_container.size()) {
            throw std::out_of_range("Heap::fix() index out of range");
        }
        if (!down(i, m_container.size())) {
            up(i);
        }
    }

    C& container() { return m_container; }
    const C& container() const { return m_container; }

private:
    void up(std::size_t j) {
        while (j > 0) {
            std::size_t parent = (j - 1) / 2;
            if (!m_container.less(j, parent)) {
                break;
            }
            m_container.swap(parent, j);
            j = parent;
        }
    }

    // Returns true if the element at i0 moved.
    bool down(std::size_t i0, std::size_t n) {
        std::size_t i = i0;
        while (true) {
            std::size_t j1 = 2 * i + 1;
            if (j1 >= n) {
                break;
            }
            std::size_t j = j1;
            std::size_t j2 = j1 + 1;
            if (j2 < n && m_container.less(j2, j1)) {
                j = j2;
            }
            if (!m_container.less(j, i)) {
                break;
            }
            m_container.swap(i, j);
            i = j;
        }
        return i > i0;
    }

    C m_container;
};

} // namespace Tempo
