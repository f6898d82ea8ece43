#include "traversal_internal.hpp"
#include "codec.hpp"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace quasar
{

  namespace ops
  {

    StreamPtr range(StreamPtr up, size_t start, size_t end)
    {
      return makeStream([up = std::move(up), start, end, pos = size_t(0)]() mutable -> std::optional<Item>
                        {
        while (pos < start)
        {
          if (!up->next())
          {
            pos = end;
            return std::nullopt;
          }
          ++pos;
        }
        if (pos >= end)
          return std::nullopt;
        auto item = up->next();
        if (!item)
        {
          pos = end;
          return std::nullopt;
        }
        ++pos;
        return item; });
    }

    StreamPtr dedup(const TraversalContext &, StreamPtr up)
    {
      return makeStream([up = std::move(up), seen = std::unordered_set<Id, IdHash>()]() mutable
                        -> std::optional<Item>
                        {
        while (auto item = up->next())
        {
          if (!item->ok())
            return item;
          auto id = item->value().id();
          if (!id || seen.insert(*id).second)
            return item;
        }
        return std::nullopt; });
    }

    StreamPtr filterRef(const TraversalContext &ctx, StreamPtr up, ItemPredicate pred)
    {
      return makeStream([ctx, up = std::move(up), pred = std::move(pred)]() mutable -> std::optional<Item>
                        {
        while (auto item = up->next())
        {
          if (!item->ok())
            return item;
          bool keep = false;
          std::optional<GraphError> err;
          if (detail::capture([&]
                              { keep = pred(item->value(), ctx.txn); },
                              err))
            return Item(std::move(*err));
          if (keep)
            return item;
        }
        return std::nullopt; });
    }

    StreamPtr map(const TraversalContext &ctx, StreamPtr up, ItemMapper fn)
    {
      return makeStream([ctx, up = std::move(up), fn = std::move(fn)]() mutable -> std::optional<Item>
                        {
        auto item = up->next();
        if (!item || !item->ok())
          return item;
        return detail::guarded([&]
                               { return fn(std::move(item->value()), ctx.txn); }); });
    }

    StreamPtr getProperty(StreamPtr up, std::string key)
    {
      return makeStream([up = std::move(up), key = std::move(key)]() mutable -> std::optional<Item>
                        {
        auto item = up->next();
        if (!item || !item->ok())
          return item;
        const Value *v = item->value().get(key);
        return Item(TraversalValue(v ? *v : Value())); });
    }

    StreamPtr orderBy(StreamPtr up, std::string key, bool descending)
    {
      return makeStream([up = std::move(up), key = std::move(key), descending, sorted = std::vector<Item>(),
                         pos = size_t(0), loaded = false]() mutable -> std::optional<Item>
                        {
        if (!loaded)
        {
          loaded = true;
          std::vector<Item> values;
          for (auto &item : detail::drain(up))
          {
            if (item.ok())
              values.push_back(std::move(item));
            else
              sorted.push_back(std::move(item));
          }
          const Value empty;
          auto keyOf = [&](const Item &item) -> const Value &
          {
            const Value *v = item.value().get(key);
            return v ? *v : empty;
          };
          std::stable_sort(values.begin(), values.end(), [&](const Item &a, const Item &b)
                           {
            int c = compareValues(keyOf(a), keyOf(b));
            return descending ? c > 0 : c < 0; });
          for (auto &item : values)
            sorted.push_back(std::move(item));
        }
        if (pos >= sorted.size())
          return std::nullopt;
        return std::move(sorted[pos++]); });
    }

    StreamPtr intersect(StreamPtr up, SubTraversal sub)
    {
      return makeStream([up = std::move(up), sub = std::move(sub), out = std::vector<Item>(), pos = size_t(0),
                         loaded = false]() mutable -> std::optional<Item>
                        {
        if (!loaded)
        {
          loaded = true;
          struct ResultSet
          {
            std::vector<TraversalValue> items;
            std::unordered_set<Id, IdHash> ids;
          };
          std::vector<ResultSet> sets;
          for (auto &item : detail::drain(up))
          {
            if (!item.ok())
            {
              out.push_back(std::move(item));
              continue;
            }
            std::vector<Item> seed;
            seed.push_back(std::move(item));
            StreamPtr result = sub(itemsStream(std::move(seed)));
            ResultSet set;
            for (auto &r : detail::drain(result))
            {
              if (!r.ok())
              {
                out.push_back(std::move(r));
                continue;
              }
              if (auto id = r.value().id())
              {
                set.ids.insert(*id);
                set.items.push_back(std::move(r.value()));
              }
            }
            sets.push_back(std::move(set));
          }
          if (!sets.empty())
          {
            std::sort(sets.begin(), sets.end(), [](const ResultSet &a, const ResultSet &b)
                      { return a.ids.size() < b.ids.size(); });
            std::unordered_set<Id, IdHash> common = sets.front().ids;
            for (size_t i = 1; i < sets.size() && !common.empty(); ++i)
            {
              for (auto it = common.begin(); it != common.end();)
              {
                if (sets[i].ids.count(*it))
                  ++it;
                else
                  it = common.erase(it);
              }
            }
            std::unordered_set<Id, IdHash> emitted;
            for (auto &v : sets.front().items)
            {
              Id id = *v.id();
              if (common.count(id) && emitted.insert(id).second)
                out.push_back(Item(std::move(v)));
            }
          }
        }
        if (pos >= out.size())
          return std::nullopt;
        return std::move(out[pos++]); });
    }

    StreamPtr groupBy(const TraversalContext &ctx, StreamPtr up, std::vector<std::string> keys, bool countOnly,
                      bool keepItems)
    {
      return makeStream([ctx, up = std::move(up), keys = std::move(keys), countOnly, keepItems,
                         out = std::vector<Item>(), pos = size_t(0), loaded = false]() mutable -> std::optional<Item>
                        {
        if (!loaded)
        {
          loaded = true;
          struct Bucket
          {
            Properties values;
            uint64_t count{0};
            std::vector<TraversalValue> items;
          };
          std::vector<Bucket> buckets;
          std::unordered_map<std::string, size_t> byKey;
          for (auto &item : detail::drain(up))
          {
            if (!item.ok())
            {
              out.push_back(std::move(item));
              continue;
            }
            const TraversalValue &value = item.value();
            std::string joined;
            for (size_t i = 0; i < keys.size(); ++i)
            {
              if (i)
                joined += '_';
              const Value *v = value.get(keys[i]);
              joined += v ? valueToString(*v) : "null";
            }
            auto [it, inserted] = byKey.emplace(joined, buckets.size());
            if (inserted)
            {
              Bucket b;
              for (const auto &k : keys)
              {
                const Value *v = value.get(k);
                b.values.emplace_back(k, v ? *v : Value());
              }
              buckets.push_back(std::move(b));
            }
            Bucket &b = buckets[it->second];
            ++b.count;
            if (keepItems && !countOnly)
              b.items.push_back(std::move(item.value()));
          }
          for (auto &b : buckets)
          {
            Group g;
            g.count = b.count;
            if (!countOnly)
              g.values = copyToArena(ctx.arena, std::move(b.values));
            if (keepItems && !countOnly)
              g.items = &ctx.arena.allocate<std::vector<TraversalValue>>(std::move(b.items));
            out.push_back(Item(TraversalValue(g)));
          }
        }
        if (pos >= out.size())
          return std::nullopt;
        return std::move(out[pos++]); });
    }

    StreamPtr countToValue(StreamPtr up)
    {
      return makeStream([up = std::move(up), n = uint64_t(0), done = false]() mutable -> std::optional<Item>
                        {
        if (done)
          return std::nullopt;
        while (auto item = up->next())
        {
          if (!item->ok())
            return item;
          ++n;
        }
        done = true;
        return Item(TraversalValue(Value(std::in_place_type<uint64_t>, n))); });
    }

    // -------------------- terminals --------------------

    std::vector<TraversalValue> collect(StreamPtr up)
    {
      std::vector<TraversalValue> out;
      while (auto item = up->next())
      {
        if (!item->ok())
          throw item->error();
        out.push_back(std::move(item->value()));
      }
      return out;
    }

    std::vector<TraversalValue> collectOk(StreamPtr up)
    {
      std::vector<TraversalValue> out;
      while (auto item = up->next())
      {
        if (item->ok())
          out.push_back(std::move(item->value()));
      }
      return out;
    }

    std::optional<TraversalValue> first(StreamPtr up)
    {
      auto item = up->next();
      if (!item)
        return std::nullopt;
      if (!item->ok())
        throw item->error();
      return std::move(item->value());
    }

    size_t count(StreamPtr up)
    {
      size_t n = 0;
      while (auto item = up->next())
      {
        if (item->ok())
          ++n;
      }
      return n;
    }

    bool exist(StreamPtr up)
    {
      while (auto item = up->next())
      {
        if (item->ok())
          return true;
      }
      return false;
    }

    bool mapValueOr(StreamPtr up, bool fallback, const std::function<bool(const Value &)> &pred)
    {
      auto item = up->next();
      if (!item)
        return fallback;
      if (!item->ok())
        throw item->error();
      if (auto v = std::get_if<Value>(&item->value()))
        return pred(*v);
      return fallback;
    }

  } // namespace ops

} // namespace quasar
