#pragma once

#include <skipdex/common/status.hpp>
#include <skipdex/common/types.hpp>
#include <skipdex/index/random_source.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace skipdex {

// Rejects max_level < 0 and promotion probabilities outside (0, 1).
Status ValidateIndexOptions(const IndexOptions& options);

// Skip list keyed by Key: expected O(log n) search/insert/delete, O(n) ordered walk.
// Thread Safety: none, callers serialize every mutating call
template<typename Key, typename Value,
         typename Comparator = std::less<Key>,
         typename RandomSource = UniformRandomSource>
class OrderedIndex {
    struct Node;

    // Forward links of one position; the header is a bare Links with max_level + 1 slots.
    struct Links {
        explicit Links(Level level) : forward(static_cast<size_t>(level) + 1, nullptr) {}
        std::vector<Node*> forward;
    };

    struct Node : Links {
        Node(const Key& k, Value v, Level level) : Links(level), key(k), value(std::move(v)) {}
        Key const key;
        Value value;
    };

public:
    class Iterator {
    public:
        explicit Iterator(const OrderedIndex* index) : index_(index), node_(nullptr) {}
        bool Valid() const { return node_ != nullptr; }
        const Key& key() const { return node_->key; }
        const Value& value() const { return node_->value; }
        void Next() { node_ = node_->forward[0]; }
        void SeekToFirst() { node_ = index_->head_->forward[0]; }
    private:
        const OrderedIndex* index_;
        const Node* node_;
    };

    /**
     * @brief Build an index after validating its configuration
     * @param options max_level and promotion_probability; seed is ignored here
     * @param source Callable returning uniform doubles in [0, 1)
     * @return The index, or InvalidArgument for a bad configuration
     */
    static Result<OrderedIndex> Create(const IndexOptions& options, RandomSource source,
                                       Comparator cmp = Comparator()) {
        Status s = ValidateIndexOptions(options);
        if (!s.ok()) {
            return s;
        }
        spdlog::debug("OrderedIndex created: max_level={}, p={}",
                      options.max_level, options.promotion_probability);
        return OrderedIndex(options.max_level, options.promotion_probability,
                            std::move(source), std::move(cmp));
    }

    // Seeds RandomSource from options.seed, or from std::random_device when unset.
    static Result<OrderedIndex> Create(const IndexOptions& options = {}) {
        uint32_t seed = options.seed ? *options.seed : std::random_device{}();
        return Create(options, RandomSource(seed));
    }

    ~OrderedIndex() {
        if (head_) ReleaseNodes();
    }

    OrderedIndex(const OrderedIndex&) = delete;
    OrderedIndex& operator=(const OrderedIndex&) = delete;

    // A moved-from index reports Size() == 0 and CurrentLevel() == 0; beyond
    // those it may only be destroyed or assigned to.
    OrderedIndex(OrderedIndex&& other)
        : compare_(std::move(other.compare_)), random_(std::move(other.random_)),
          max_level_(other.max_level_), probability_(other.probability_),
          level_(other.level_), count_(other.count_), head_(std::move(other.head_)) {
        other.level_ = 0;
        other.count_ = 0;
    }

    OrderedIndex& operator=(OrderedIndex&& other) {
        if (this != &other) {
            if (head_) ReleaseNodes();
            compare_ = std::move(other.compare_);
            random_ = std::move(other.random_);
            max_level_ = other.max_level_;
            probability_ = other.probability_;
            level_ = other.level_;
            count_ = other.count_;
            head_ = std::move(other.head_);
            other.level_ = 0;
            other.count_ = 0;
        }
        return *this;
    }

    /**
     * @brief Draw a node height: promote while the draw is below p, capped at max_level
     */
    Level RandomLevel() {
        Level level = 0;
        while (random_() < probability_ && level < max_level_) level++;
        return level;
    }

    std::optional<Value> Search(const Key& key) const {
        const Value* v = Find(key);
        if (v == nullptr) return std::nullopt;
        return *v;
    }

    const Value* Find(const Key& key) const {
        Node* x = FindGreaterOrEqual(key, nullptr);
        return (x != nullptr && Equal(key, x->key)) ? &x->value : nullptr;
    }

    Value* Find(const Key& key) {
        Node* x = FindGreaterOrEqual(key, nullptr);
        return (x != nullptr && Equal(key, x->key)) ? &x->value : nullptr;
    }

    bool Contains(const Key& key) const { return Find(key) != nullptr; }

    /**
     * @brief Insert key, or replace the value of an existing key in place
     *
     * A new node is spliced in at levels 0..RandomLevel(); when it is taller
     * than the list the header becomes its predecessor at the new levels.
     */
    void Insert(const Key& key, Value value) {
        std::vector<Links*> update(static_cast<size_t>(max_level_) + 1, nullptr);
        Node* x = FindGreaterOrEqual(key, update.data());
        if (x != nullptr && Equal(key, x->key)) {
            x->value = std::move(value);
            return;
        }

        Level height = RandomLevel();
        Node* node = new Node(key, std::move(value), height);
        if (height > level_) {
            for (Level i = level_ + 1; i <= height; ++i) update[i] = head_.get();
            spdlog::trace("OrderedIndex level raised {} -> {}", level_, height);
            level_ = height;
        }
        for (Level i = 0; i <= height; ++i) {
            node->forward[i] = update[i]->forward[i];
            update[i]->forward[i] = node;
        }
        count_++;
    }

    /**
     * @brief Unlink key at every level it occupies and release its node
     * @return false if the key is absent (nothing changes)
     */
    bool Delete(const Key& key) {
        std::vector<Links*> update(static_cast<size_t>(max_level_) + 1, nullptr);
        Node* x = FindGreaterOrEqual(key, update.data());
        if (x == nullptr || !Equal(key, x->key)) {
            return false;
        }

        // Level membership is a prefix: the first level where x is not the successor ends it.
        for (Level i = 0; i <= level_; ++i) {
            if (update[i]->forward[i] != x) break;
            update[i]->forward[i] = x->forward[i];
        }

        Level old_level = level_;
        while (level_ > 0 && head_->forward[level_] == nullptr) level_--;
        if (level_ != old_level) {
            spdlog::trace("OrderedIndex level shrunk {} -> {}", old_level, level_);
        }

        delete x;
        count_--;
        return true;
    }

    std::vector<std::pair<Key, Value>> ToOrderedSequence() const {
        std::vector<std::pair<Key, Value>> result;
        result.reserve(count_);
        Iterator iter(this);
        for (iter.SeekToFirst(); iter.Valid(); iter.Next()) {
            result.emplace_back(iter.key(), iter.value());
        }
        return result;
    }

    // Per-level listing from CurrentLevel() down to 0, one "Level i: (k, v) ..." line each.
    std::string DumpStructure() const {
        std::ostringstream out;
        for (Level i = level_; i >= 0; --i) {
            out << "Level " << i << ":";
            for (const Node* n = head_->forward[i]; n != nullptr; n = n->forward[i]) {
                out << " (" << n->key << ", " << n->value << ")";
            }
            out << "\n";
        }
        return out.str();
    }

    // Number of nodes linked at level; 0 outside [0, MaxLevel()].
    size_t NodesAtLevel(Level level) const {
        if (level < 0 || level > max_level_) return 0;
        size_t n = 0;
        for (const Node* x = head_->forward[level]; x != nullptr; x = x->forward[level]) n++;
        return n;
    }

    bool HeaderLinkAt(Level level) const {
        return level >= 0 && level <= max_level_ && head_->forward[level] != nullptr;
    }

    void Clear() {
        ReleaseNodes();
        std::fill(head_->forward.begin(), head_->forward.end(), nullptr);
        level_ = 0;
        count_ = 0;
    }

    Iterator NewIterator() const { return Iterator(this); }

    [[nodiscard]] size_t Size() const { return count_; }
    [[nodiscard]] bool empty() const { return count_ == 0; }
    [[nodiscard]] Level CurrentLevel() const { return level_; }
    [[nodiscard]] Level MaxLevel() const { return max_level_; }
    [[nodiscard]] double PromotionProbability() const { return probability_; }

private:
    OrderedIndex(Level max_level, double probability, RandomSource source, Comparator cmp)
        : compare_(std::move(cmp)), random_(std::move(source)),
          max_level_(max_level), probability_(probability),
          head_(std::make_unique<Links>(max_level)) {}

    bool Equal(const Key& a, const Key& b) const { return !compare_(a, b) && !compare_(b, a); }
    bool KeyIsAfterNode(const Key& key, const Node* n) const { return n != nullptr && compare_(n->key, key); }

    // Descends from level_ to 0; update (if non-null) receives the predecessor at each level.
    Node* FindGreaterOrEqual(const Key& key, Links** update) const {
        Links* x = head_.get();
        for (Level i = level_; i >= 0; --i) {
            Node* next = x->forward[i];
            while (KeyIsAfterNode(key, next)) {
                x = next;
                next = x->forward[i];
            }
            if (update) update[i] = x;
        }
        return x->forward[0];
    }

    void ReleaseNodes() {
        Node* x = head_->forward[0];
        while (x != nullptr) {
            Node* next = x->forward[0];
            delete x;
            x = next;
        }
    }

    Comparator compare_;
    RandomSource random_;
    Level max_level_;
    double probability_;
    Level level_{0};
    size_t count_{0};
    std::unique_ptr<Links> head_;
};

} // namespace skipdex
