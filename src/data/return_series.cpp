/**
 * @file return_series.cpp
 * @brief Implementation of ReturnSeries and AssetUniverse.
 */

#include "data/return_series.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>
#include <utility>

namespace riskengine
{
    namespace data
    {

        // ===================================================================
        // ReturnSeries
        // ===================================================================

        ReturnSeries::ReturnSeries(std::string id, std::vector<double> returns)
            : id_(std::move(id)), returns_(std::move(returns))
        {
            if (id_.empty())
            {
                throw std::invalid_argument("Return series identifier cannot be empty");
            }
        }

        ReturnSeries ReturnSeries::tail(int window_days) const
        {
            if (window_days <= 0 || static_cast<size_t>(window_days) >= returns_.size())
            {
                return *this;
            }

            std::vector<double> trailing(returns_.end() - window_days, returns_.end());
            return ReturnSeries(id_, std::move(trailing));
        }

        // ===================================================================
        // AssetUniverse
        // ===================================================================

        AssetUniverse::AssetUniverse(std::vector<ReturnSeries> assets,
                                     std::map<std::string, AssetMetadata> metadata)
            : assets_(std::move(assets)), metadata_(std::move(metadata))
        {
            if (assets_.empty())
            {
                throw std::invalid_argument("Asset universe must contain at least one asset");
            }

            std::set<std::string> seen;
            for (const auto &asset : assets_)
            {
                if (!seen.insert(asset.id()).second)
                {
                    throw std::invalid_argument("Duplicate asset identifier in universe: " + asset.id());
                }
            }

            for (const auto &entry : metadata_)
            {
                if (seen.count(entry.first) == 0)
                {
                    throw std::invalid_argument("Metadata supplied for unknown asset: " + entry.first);
                }
            }
        }

        const ReturnSeries &AssetUniverse::at(size_t i) const
        {
            if (i >= assets_.size())
            {
                throw std::out_of_range(
                    "Asset index " + std::to_string(i) + " out of range for universe of size " + std::to_string(assets_.size()));
            }
            return assets_[i];
        }

        size_t AssetUniverse::index_of(const std::string &id) const
        {
            auto it = std::find_if(assets_.begin(), assets_.end(),
                                   [&id](const ReturnSeries &s)
                                   { return s.id() == id; });
            if (it == assets_.end())
            {
                throw std::invalid_argument("Asset not found in universe: " + id);
            }
            return static_cast<size_t>(std::distance(assets_.begin(), it));
        }

        bool AssetUniverse::contains(const std::string &id) const
        {
            return std::any_of(assets_.begin(), assets_.end(),
                               [&id](const ReturnSeries &s)
                               { return s.id() == id; });
        }

        std::vector<std::string> AssetUniverse::identifiers() const
        {
            std::vector<std::string> ids;
            ids.reserve(assets_.size());
            for (const auto &asset : assets_)
            {
                ids.push_back(asset.id());
            }
            return ids;
        }

        AssetMetadata AssetUniverse::metadata(const std::string &id) const
        {
            auto it = metadata_.find(id);
            if (it != metadata_.end())
            {
                return it->second;
            }
            return AssetMetadata{id, ""};
        }

        size_t AssetUniverse::min_length() const
        {
            size_t shortest = assets_.front().size();
            for (const auto &asset : assets_)
            {
                shortest = std::min(shortest, asset.size());
            }
            return shortest;
        }

        bool AssetUniverse::is_aligned() const
        {
            return std::all_of(assets_.begin(), assets_.end(),
                               [this](const ReturnSeries &s)
                               { return s.size() == assets_.front().size(); });
        }

        AssetUniverse AssetUniverse::tail(int window_days) const
        {
            std::vector<ReturnSeries> trailing;
            trailing.reserve(assets_.size());
            for (const auto &asset : assets_)
            {
                trailing.push_back(asset.tail(window_days));
            }
            return AssetUniverse(std::move(trailing), metadata_);
        }

    } // namespace data
} // namespace riskengine
