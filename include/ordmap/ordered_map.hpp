#pragma once

/// @file ordered_map.hpp
/// @brief OrderedMap: persistent, insertion-ordered map with unique keys.
///
/// Implementation:
///   - Three co-indexed structures: values (insertion order), key -> position
///     hash map, position -> key vector
///   - Copy-on-write: a version points at a shared storage block; mutating an
///     lvalue produces a new block and never touches versions others hold
///   - Rvalue receivers that own their block alone are mutated in place, so
///     builder chains (`std::move(m).set(...)`) do not copy per step
///   - A default-constructed map has no block at all; the first insert
///     allocates it, and every read treats the missing block as empty
///
/// Thread safety: a published block is never modified, so distinct OrderedMap
/// objects may be read from different threads. Mutating one OrderedMap object
/// from several threads needs external synchronization; no locking is done.
///
/// @code
///   auto m = ordmap::OrderedMap<std::string, int>()
///                .set("a", 1)
///                .set("b", 2);
///   auto n = m.erase("a");          // m still holds a and b
///   m.for_each([](const std::string& k, int v) { std::cout << k << v; });
/// @endcode

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "log.hpp"

#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ordmap {
namespace detail {

template <typename T, typename = void>
struct is_streamable : std::false_type {};

template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

/// @brief Render a key for diagnostics (KeyAlreadyExists, log lines).
template <typename K>
std::string key_to_string(const K& key) {
    if constexpr (std::is_convertible_v<const K&, std::string_view>) {
        return std::string(std::string_view(key));
    } else if constexpr (std::is_same_v<K, bool>) {
        return key ? "true" : "false";
    } else if constexpr (is_streamable<K>::value) {
        std::ostringstream os;
        os << key;
        return os.str();
    } else {
        return "<unprintable key>";
    }
}

} // namespace detail

template <typename K, typename V, typename Hash, typename KeyEqual>
class OrderedMap {
    struct Storage;

public:
    using key_type       = K;
    using mapped_type    = V;
    using size_type      = size_t;
    using hasher         = Hash;
    using key_equal      = KeyEqual;
    using unordered_type = std::unordered_map<K, V, Hash, KeyEqual>;

    /// @brief Read-only forward iterator over (key, value) in insertion order.
    ///
    /// An iterator shares ownership of the storage block it was taken from,
    /// so it keeps reading that version after the map it came from is
    /// reassigned or mutated. Dereferencing yields references into the block
    /// that stay valid while the iterator (or any version sharing the block)
    /// lives.
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = std::pair<const K&, const V&>;
        using difference_type   = std::ptrdiff_t;
        using reference         = value_type;
        using pointer           = void;

        const_iterator() noexcept = default;

        reference operator*() const {
            return {storage_->keys[index_], storage_->values[index_]};
        }
        const_iterator& operator++() noexcept { ++index_; return *this; }
        const_iterator operator++(int) noexcept { auto tmp = *this; ++index_; return tmp; }

        bool operator==(const const_iterator& o) const noexcept { return index_ == o.index_; }
        bool operator!=(const const_iterator& o) const noexcept { return index_ != o.index_; }

    private:
        friend class OrderedMap;
        const_iterator(std::shared_ptr<const Storage> storage, size_t index) noexcept
            : storage_(std::move(storage)), index_(index) {}

        std::shared_ptr<const Storage> storage_;
        size_t index_ = 0;
    };
    using iterator = const_iterator;

    // ─── Construction ─────────────────────────────────────────────────

    /// Zero form: no storage until the first insert.
    OrderedMap() noexcept = default;

    /// @throws KeyAlreadyExists if the list repeats a key.
    OrderedMap(std::initializer_list<std::pair<K, V>> init) {
        for (const auto& [key, value] : init) insert_or_throw(K(key), V(value));
    }

    /// @brief Empty map with its storage already allocated.
    [[nodiscard]] static OrderedMap make() {
        OrderedMap m;
        m.storage_ = std::make_shared<Storage>();
        return m;
    }

    // ─── Insertion ────────────────────────────────────────────────────

    /// @brief New version with (key, value) appended.
    /// @throws KeyAlreadyExists if key is present; *this is unchanged.
    [[nodiscard]] OrderedMap set(K key, V value) const& {
        OrderedMap next(*this);
        next.insert_or_throw(std::move(key), std::move(value));
        return next;
    }
    [[nodiscard]] OrderedMap set(K key, V value) && {
        insert_or_throw(std::move(key), std::move(value));
        return std::move(*this);
    }

    /// @brief set() without exceptions.
    ///
    /// On collision the result holds an unchanged copy of *this and
    /// errc::key_already_exists, and the key is logged at debug level. Use
    /// set() to receive the key inside KeyAlreadyExists instead.
    [[nodiscard]] result<OrderedMap> try_set(K key, V value) const& {
        if (contains(key)) return {*this, collision("try_set", key)};
        return {set(std::move(key), std::move(value)), {}};
    }
    [[nodiscard]] result<OrderedMap> try_set(K key, V value) && {
        if (contains(key)) return {std::move(*this), collision("try_set", key)};
        return {std::move(*this).set(std::move(key), std::move(value)), {}};
    }

    /// @brief set() for call sites where a duplicate key is a programming error.
    ///
    /// On collision this logs at error level and aborts the process. There is
    /// no way to recover; use set() or try_set() for data-driven keys.
    [[nodiscard]] OrderedMap must_set(K key, V value) const& {
        OrderedMap next(*this);
        next.insert_or_abort(std::move(key), std::move(value));
        return next;
    }
    [[nodiscard]] OrderedMap must_set(K key, V value) && {
        insert_or_abort(std::move(key), std::move(value));
        return std::move(*this);
    }

    // ─── Removal ──────────────────────────────────────────────────────

    /// @brief New version without key. Absent keys are not an error.
    [[nodiscard]] OrderedMap erase(const K& key) const& {
        OrderedMap next(*this);
        next.remove(key);
        return next;
    }
    [[nodiscard]] OrderedMap erase(const K& key) && {
        remove(key);
        return std::move(*this);
    }

    // ─── Lookup ───────────────────────────────────────────────────────

    [[nodiscard]] size_type size() const noexcept { return storage_ ? storage_->values.size() : 0; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    [[nodiscard]] bool contains(const K& key) const {
        return storage_ && storage_->positions.find(key) != storage_->positions.end();
    }

    /// @brief Pointer to the value, or nullptr if key is absent.
    [[nodiscard]] const V* find(const K& key) const {
        if (!storage_) return nullptr;
        auto it = storage_->positions.find(key);
        if (it == storage_->positions.end()) return nullptr;
        return &storage_->values[it->second];
    }

    /// @brief Copy of the value, or V{} if key is absent.
    [[nodiscard]] V get(const K& key) const {
        if (const V* p = find(key)) return *p;
        return V{};
    }

    /// @throws OutOfRangeError (errc::key_not_found) if key is absent.
    [[nodiscard]] const V& at(const K& key) const {
        const V* p = find(key);
        if (ORDMAP_UNLIKELY(!p)) {
            throw OutOfRangeError("key not found: \"" + detail::key_to_string(key) + "\"",
                                  errc::key_not_found);
        }
        return *p;
    }

    /// @brief Current position of key in insertion order.
    [[nodiscard]] std::optional<size_type> index_of(const K& key) const {
        if (!storage_) return std::nullopt;
        auto it = storage_->positions.find(key);
        if (it == storage_->positions.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] const std::vector<K>& keys() const noexcept {
        return storage_ ? storage_->keys : empty_storage().keys;
    }
    [[nodiscard]] const std::vector<V>& values() const noexcept {
        return storage_ ? storage_->values : empty_storage().values;
    }

    // ─── Traversal ────────────────────────────────────────────────────

    /// @brief Call visit(key, value) for every entry in insertion order.
    ///
    /// The visitor returns either void or std::error_code. A non-zero code
    /// stops the traversal and is returned as is; later entries are not
    /// visited. Exceptions thrown by the visitor propagate unchanged.
    template <typename Visitor>
    std::error_code for_each(Visitor&& visit) const {
        using visit_result = std::invoke_result_t<Visitor&, const K&, const V&>;
        static_assert(std::is_void_v<visit_result> ||
                      std::is_convertible_v<visit_result, std::error_code>,
                      "visitor must return void or std::error_code");
        // Pin the block: the visitor may reassign *this.
        const std::shared_ptr<Storage> pinned = storage_;
        if (!pinned) return {};
        const Storage& s = *pinned;
        for (size_t i = 0; i < s.values.size(); ++i) {
            if constexpr (std::is_void_v<visit_result>) {
                visit(s.keys[i], s.values[i]);
            } else {
                std::error_code ec = visit(s.keys[i], s.values[i]);
                if (ec) return ec;
            }
        }
        return {};
    }

    /// @brief Same entries in a hash map; order is not kept.
    [[nodiscard]] unordered_type unordered() const {
        unordered_type out;
        out.reserve(size());
        // A void visitor cannot fail, so there is no error to inspect.
        for_each([&out](const K& key, const V& value) { out.emplace(key, value); });
        return out;
    }

    [[nodiscard]] const_iterator begin() const noexcept { return {storage_, 0}; }
    [[nodiscard]] const_iterator end() const noexcept { return {storage_, size()}; }

    // ─── Comparison ───────────────────────────────────────────────────

    /// Equal when both hold the same keys in the same order with equal values.
    [[nodiscard]] bool operator==(const OrderedMap& other) const {
        if (storage_ == other.storage_) return true;
        if (size() != other.size()) return false;
        const KeyEqual eq{};
        const auto& ka = keys();
        const auto& kb = other.keys();
        for (size_t i = 0; i < ka.size(); ++i) {
            if (!eq(ka[i], kb[i])) return false;
        }
        return values() == other.values();
    }
    [[nodiscard]] bool operator!=(const OrderedMap& other) const { return !(*this == other); }

    /// @brief Number of versions sharing this map's storage block (0 in zero form).
    [[nodiscard]] long use_count() const noexcept { return storage_.use_count(); }

private:
    struct Storage {
        std::vector<V> values;
        std::unordered_map<K, size_t, Hash, KeyEqual> positions;
        std::vector<K> keys;
    };

    std::shared_ptr<Storage> storage_;

    static const Storage& empty_storage() noexcept {
        static const Storage instance;
        return instance;
    }

    /// Storage owned by this version alone: allocated in zero form, copied if shared.
    Storage& detach() {
        if (!storage_) {
            storage_ = std::make_shared<Storage>();
        } else if (storage_.use_count() > 1) {
            storage_ = std::make_shared<Storage>(*storage_);
        }
        return *storage_;
    }

    static std::error_code collision(const char* op, const K& key) {
        if (log_level() == LogLevel::Debug) {
            ORDMAP_LOG_DEBUG("%s: key \"%s\" already exists", op,
                             detail::key_to_string(key).c_str());
        }
        return make_error_code(errc::key_already_exists);
    }

    void insert_or_throw(K&& key, V&& value) {
        if (ORDMAP_UNLIKELY(contains(key))) {
            throw KeyAlreadyExists(detail::key_to_string(key));
        }
        append(std::move(key), std::move(value));
    }

    void insert_or_abort(K&& key, V&& value) {
        if (ORDMAP_UNLIKELY(contains(key))) {
            ORDMAP_LOG_ERROR("must_set: key \"%s\" already exists",
                             detail::key_to_string(key).c_str());
            std::abort();
        }
        append(std::move(key), std::move(value));
    }

    /// Caller has checked that key is absent.
    void append(K&& key, V&& value) {
        Storage& s = detach();
        const size_t ix = s.values.size();
        auto pos = s.positions.emplace(key, ix).first;
        try {
            s.keys.push_back(std::move(key));
            s.values.push_back(std::move(value));
        } catch (...) {
            if (s.keys.size() > ix) s.keys.pop_back();
            s.positions.erase(pos);
            throw;
        }
    }

    /// Remove key and close the gap: every entry after the slot moves down one.
    void remove(const K& key) {
        if (!contains(key)) return;
        Storage& s = detach();
        auto it = s.positions.find(key);
        const size_t ix = it->second;
        s.positions.erase(it);

        const size_t last = s.values.size() - 1;
        for (size_t i = ix; i < last; ++i) {
            s.keys[i] = std::move(s.keys[i + 1]);
            s.values[i] = std::move(s.values[i + 1]);
            s.positions.find(s.keys[i])->second = i;
        }
        s.keys.pop_back();
        s.values.pop_back();
    }
};

} // namespace ordmap
