#pragma once
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <optional>
#include <cassert>

// Lexically scoped bindings. Lookups see the innermost binding of a key, popping a scope drops
// every binding made in it
template <typename K, typename V>
class ScopedStore {
private:
    struct ValEntry {
        V val;
        // zero indexed
        size_t scope_ind;
        ValEntry(const V& val, size_t scope_ind): val(val), scope_ind(scope_ind) {}
    };
    std::vector<std::unordered_set<K>> scope_list;
    std::unordered_map<K, std::vector<ValEntry>> key_val_map;
public:
    ScopedStore() {}
    void create_new_scope() {
        scope_list.emplace_back();
    }
    // creates a copy and stores it in the map
    void insert(const K& key, const V& value) {
        // Note that insert assumes that [key] is not in the latest scope
        assert(scope_list.size() > 0);
        assert(!key_in_curr_scope(key));
        scope_list.back().insert(key);
        size_t scope_ind = scope_list.size() - 1;
        key_val_map[key].emplace_back(value, scope_ind);
    }
    // Shadowing inside the same scope (eg `let x = ..; let x = ..;`) replaces the binding
    void insert_or_replace(const K& key, const V& value) {
        if(key_in_curr_scope(key)) {
            key_val_map.at(key).back().val = value;
            return;
        }
        insert(key, value);
    }
    std::optional<V> get_value(const K& key) const {
        auto it = key_val_map.find(key);
        if(it == key_val_map.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second.back().val;
    }

    bool key_in_curr_scope(const K& key) const {
        assert(scope_list.size() > 0);
        return scope_list.back().contains(key);
    }

    void pop_scope() {
        assert(scope_list.size() > 0);
        for(const K& k: scope_list.back()) {
            assert(key_val_map.find(k) != key_val_map.end());
            assert(key_val_map[k].size() > 0);
            key_val_map[k].pop_back();
        }
        scope_list.pop_back();
    }
};

template <typename K, typename V>
struct ScopeGuard {
private:
    ScopedStore<K, V>& scoped_context;
public:
    explicit ScopeGuard(ScopedStore<K, V>& scoped_context)
    : scoped_context(scoped_context) {
        scoped_context.create_new_scope();
    }
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;
    ~ScopeGuard() {
        scoped_context.pop_scope();
    }
};
