#pragma once
#include <map>
#include <optional>

namespace vault {

// Map that remembers the original value of every key touched since the
// last commit so that all changes can be undone.
template <typename K, typename V>
class RollbackMap {
public:
    using map_t = std::map<K, V>;
    const V* find(const K& k) const
    {
        auto iter { data.find(k) };
        if (iter == data.end())
            return nullptr;
        return &iter->second;
    }
    bool contains(const K& k) const { return data.contains(k); }
    [[nodiscard]] std::optional<V> get(const K& k) const
    {
        if (auto p { find(k) })
            return *p;
        return {};
    }
    void set(const K& k, V v)
    {
        register_original(k);
        data.insert_or_assign(k, std::move(v));
    }
    void erase(const K& k)
    {
        if (!data.contains(k))
            return;
        register_original(k);
        data.erase(k);
    }
    const map_t& entries() const { return data; }
    size_t size() const { return data.size(); }
    bool dirty() const { return !originals.empty(); }

    void commit() { originals.clear(); }
    void rollback()
    {
        for (auto& [k, o] : originals) {
            if (o)
                data.insert_or_assign(k, std::move(*o));
            else
                data.erase(k);
        }
        originals.clear();
    }

private:
    void register_original(const K& k)
    {
        if (originals.contains(k))
            return;
        auto iter { data.find(k) };
        if (iter == data.end())
            originals.emplace(k, std::nullopt);
        else
            originals.emplace(k, iter->second);
    }
    map_t data;
    std::map<K, std::optional<V>> originals;
};

template <typename T>
class RollbackValue {
public:
    RollbackValue(T v)
        : value(std::move(v))
    {
    }
    const T& get() const { return value; }
    void set(T v)
    {
        if (!original)
            original = value;
        value = std::move(v);
    }
    void commit() { original.reset(); }
    void rollback()
    {
        if (original) {
            value = std::move(*original);
            original.reset();
        }
    }

private:
    T value;
    std::optional<T> original;
};
}
