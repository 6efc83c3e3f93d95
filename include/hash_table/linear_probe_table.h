#pragma once

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "hash_table/capacity_primes.h"
#include "hash_table/hash_table_errors.h"

template <typename V>
struct Probe_item {
    std::string key;
    V value;
};

// Outcome of a linear probe
enum class ProbeStatus : uint8_t {
    Hit = 0,            // Slot holds the key
    InsertionPoint = 1, // First empty slot on the key's probe chain
    Full = 2,           // Insertion probe on a full table, caller has to grow
    NotFound = 3        // Lookup reached an empty slot or wrapped around
};

struct ProbeResult {
    ProbeStatus status;
    size_t position; // Only valid for Hit and InsertionPoint

    static ProbeResult hit(size_t p)             { return {ProbeStatus::Hit, p}; }
    static ProbeResult insertion_point(size_t p) { return {ProbeStatus::InsertionPoint, p}; }
    static ProbeResult full()                    { return {ProbeStatus::Full, 0}; }
    static ProbeResult not_found()               { return {ProbeStatus::NotFound, 0}; }
};

// Open addressing hash table keyed by strings, linear probing on collision.
// remove() reinserts the rest of the primary cluster instead of leaving
// tombstones, so every stored key stays reachable from its hash position
// without crossing an empty slot.
// No internal locking, callers sharing a table between threads must serialize.
template <typename V>
class LinearProbeTable {
public:
    static constexpr int MIN_CAPACITY = 1;
    static constexpr int DEFAULT_TABLE_SIZE = 17;
    static constexpr uint64_t DEFAULT_HASH_BASE = 31;
    static constexpr uint64_t HASH_SEED = 31415;

private:
    std::vector<std::optional<Probe_item<V>>> table;
    size_t count;
    size_t next_prime; // index into capacity_primes() of the next table size

    // Scans at most table.size() slots starting at hash(key)
    ProbeResult linear_probe(const std::string& key, bool is_insert) const {
        if (is_insert && is_full()) {
            return ProbeResult::full();
        }

        size_t position = hash(key);
        for (size_t i = 0; i < table.size(); ++i) {
            const std::optional<Probe_item<V>>& slot = table[position];

            if (!slot.has_value()) {
                if (is_insert) {
                    return ProbeResult::insertion_point(position);
                }
                return ProbeResult::not_found();
            }

            if (slot->key == key) {
                return ProbeResult::hit(position);
            }

            position = (position + 1) % table.size();
        }

        return ProbeResult::not_found();
    }

    // Insertion path shared by set(), grow() and cluster repair
    void put_item(Probe_item<V>&& item) {
        bool grown = false;

        while (true) {
            ProbeResult res = linear_probe(item.key, true);

            switch (res.status) {
            case ProbeStatus::Full:
                // a grown table is strictly larger than the count it was grown at
                if (grown) {
                    throw std::logic_error("Table still full after growing to " +
                                           std::to_string(table.size()));
                }
                grow();
                grown = true;
                break;
            case ProbeStatus::NotFound:
                throw std::logic_error("No free slot for key " + item.key +
                                       " although count is " + std::to_string(count));
            case ProbeStatus::Hit:
                table[res.position]->value = std::move(item.value);
                return;
            case ProbeStatus::InsertionPoint:
                table[res.position].emplace(std::move(item));
                count++;
                return;
            }
        }
    }

public:
    explicit LinearProbeTable(int table_size = DEFAULT_TABLE_SIZE)
        : count(0), next_prime(first_prime_index_above(table_size)) {
        int capacity = std::max(MIN_CAPACITY, table_size);

        // hash() reduces its multiplier modulo capacity - 1
        if (capacity == 1) {
            capacity = 2;
        }

        table.resize(capacity);
    }

    // Polynomial rolling hash, 0 <= result < capacity
    size_t hash(const std::string& key) const {
        const uint64_t capacity = table.size();
        uint64_t value = 0;
        uint64_t a = HASH_SEED;

        for (unsigned char c : key) {
            value = (c + a * value) % capacity;
            a = a * DEFAULT_HASH_BASE % (capacity - 1);
        }

        return value;
    }

    V get(const std::string& key) const {
        ProbeResult res = linear_probe(key, false);
        if (res.status != ProbeStatus::Hit) {
            throw KeyNotFoundError(key);
        }
        return table[res.position]->value;
    }

    std::optional<V> search(const std::string& key) const {
        ProbeResult res = linear_probe(key, false);
        if (res.status != ProbeStatus::Hit) {
            return std::nullopt;
        }
        return table[res.position]->value;
    }

    bool contains(const std::string& key) const {
        return linear_probe(key, false).status == ProbeStatus::Hit;
    }

    // Inserts or updates. Grows the table when it is full.
    void set(const std::string& key, const V& value) {
        put_item(Probe_item<V>{key, value});
    }

    void insert(const std::string& key, const V& value) {
        set(key, value);
    }

    // Best case O(K) with K the key length, worst O(K + N) when the whole
    // table is one cluster
    void remove(const std::string& key) {
        ProbeResult res = linear_probe(key, false);
        if (res.status != ProbeStatus::Hit) {
            throw KeyNotFoundError(key);
        }

        size_t position = res.position;
        table[position].reset();
        count--;

        // Reinsert what follows in the primary cluster, up to the next empty slot
        position = (position + 1) % table.size();
        while (table[position].has_value()) {
            Probe_item<V> item = std::move(*table[position]);
            table[position].reset();
            count--;

            put_item(std::move(item));
            position = (position + 1) % table.size();
        }
    }

    // Rebuilds the table at the next prime size, keeping every entry
    void grow() {
        const std::vector<size_t>& primes = capacity_primes();
        if (next_prime >= primes.size()) {
            throw CapacityExhaustedError(table.size());
        }

        LinearProbeTable<V> new_table(static_cast<int>(primes[next_prime]));
        next_prime++;

        for (std::optional<Probe_item<V>>& slot : table) {
            if (slot.has_value()) {
                new_table.put_item(std::move(*slot));
            }
        }

        table = std::move(new_table.table);
        count = new_table.count;
    }

    size_t get_count() const { return count; }
    size_t get_capacity() const { return table.size(); }
    size_t get_next_prime_index() const { return next_prime; }

    bool is_empty() const { return count == 0; }
    bool is_full() const { return count == table.size(); }

    std::optional<std::string> key_at(size_t position) const {
        if (position >= table.size()) {
            throw std::out_of_range("Slot " + std::to_string(position) +
                                    " outside table of size " + std::to_string(table.size()));
        }

        const std::optional<Probe_item<V>>& slot = table[position];
        if (!slot.has_value()) {
            return std::nullopt;
        }
        return slot->key;
    }

    // "(key,value)\n" for every entry, in slot order
    std::string to_string() const {
        std::ostringstream out;
        for (const std::optional<Probe_item<V>>& slot : table) {
            if (slot.has_value()) {
                out << "(" << slot->key << "," << slot->value << ")\n";
            }
        }
        return out.str();
    }

    void print_table() const {
        std::cout << "\nHash Table (Linear Probing, Size: " << table.size()
                  << ", Count: " << count << ")\n-------------------\n";
        std::cout << to_string();
        std::cout << "-------------------\n\n";
    }
};
