#include "traversal_internal.hpp"
#include "codec.hpp"
#include <algorithm>

namespace quasar
{

  namespace ops
  {

    StreamPtr searchV(const TraversalContext &ctx, std::vector<double> query, size_t k, std::string label,
                      VectorFilter filter)
    {
      return makeStream([ctx, query = std::move(query), k, label = std::move(label), filter = std::move(filter),
                         results = std::vector<HVector>(), pos = size_t(0), loaded = false]() mutable
                        -> std::optional<Item>
                        {
        if (!loaded)
        {
          loaded = true;
          std::optional<GraphError> err;
          if (detail::capture([&]
                              { results = ctx.storage.vectors().search(ctx.txn, ctx.arena,
                                                                       kj::ArrayPtr<const double>(query.data(), query.size()),
                                                                       k, label, filter ? &filter : nullptr); },
                              err))
            return Item(std::move(*err));
        }
        if (pos >= results.size())
          return std::nullopt;
        return Item(TraversalValue(results[pos++])); });
    }

    StreamPtr bruteForceSearchV(const TraversalContext &ctx, StreamPtr up, std::vector<double> query, size_t k)
    {
      return makeStream([ctx, up = std::move(up), query = std::move(query), k,
                         ranked = std::vector<Item>(), pos = size_t(0), loaded = false]() mutable
                        -> std::optional<Item>
                        {
        if (!loaded)
        {
          loaded = true;
          kj::ArrayPtr<const double> q(query.data(), query.size());
          std::vector<Item> errors;
          std::vector<HVector> hits;
          for (auto &item : detail::drain(up))
          {
            if (!item.ok())
            {
              errors.push_back(std::move(item));
              continue;
            }
            HVector v;
            if (auto *hv = std::get_if<HVector>(&item.value()))
              v = *hv;
            else if (auto *meta = std::get_if<VectorWithoutData>(&item.value()))
            {
              v.id = meta->id;
              v.label = meta->label;
              v.version = meta->version;
              v.level = meta->level;
              v.deleted = meta->deleted;
              v.properties = meta->properties;
              std::optional<GraphError> err;
              if (!v.deleted && detail::capture([&]
                                                { v.data = ctx.storage.vectors().getPayload(ctx.txn, ctx.arena, v.id); },
                                                err))
              {
                errors.push_back(Item(std::move(*err)));
                continue;
              }
            }
            else
              continue;
            if (v.deleted)
              continue;
            if (v.len() != q.size())
            {
              errors.push_back(Item(GraphError(VectorError(VectorError::Code::InvalidVectorLength,
                                                           "vector " + idToString(v.id) + " has length " +
                                                               std::to_string(v.len())))));
              continue;
            }
            v.distance = cosineDistance(v.data, q);
            hits.push_back(v);
          }
          std::stable_sort(hits.begin(), hits.end(), [](const HVector &a, const HVector &b)
                           { return *a.distance < *b.distance; });
          if (hits.size() > k)
            hits.resize(k);
          ranked = std::move(errors);
          for (auto &h : hits)
            ranked.push_back(Item(TraversalValue(h)));
        }
        if (pos >= ranked.size())
          return std::nullopt;
        return std::move(ranked[pos++]); });
    }

    StreamPtr insertV(const TraversalContext &ctx, std::vector<double> query, std::string label, Properties props)
    {
      return makeStream([ctx, query = std::move(query), label = std::move(label), props = std::move(props),
                         done = false]() mutable -> std::optional<Item>
                        {
        if (done)
          return std::nullopt;
        done = true;
        return detail::guarded([&]
                               {
          const Properties *stored = props.empty() ? nullptr : copyToArena(ctx.arena, std::move(props));
          return ctx.storage.vectors().insert(ctx.txn, ctx.arena,
                                              kj::ArrayPtr<const double>(query.data(), query.size()), label, stored,
                                              ctx.storage.versionInfo().latest(label)); }); });
    }

  } // namespace ops

} // namespace quasar
