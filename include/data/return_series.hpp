/**
 * @file return_series.hpp
 * @brief Immutable containers for daily return series and asset universes.
 *
 * A ReturnSeries is an identified, index-aligned sequence of daily
 * fractional returns. An AssetUniverse is an ordered collection of
 * ReturnSeries with unique identifiers; its order defines the row and
 * column order of every matrix and the alignment of every weight vector.
 *
 * Display metadata (label, color) is held in AssetMetadata, separate from
 * the numeric payload, and never participates in computations.
 *
 * @note Series lengths are not enforced here. Short or ragged series are
 *       handled by the statistics layer (NaN results, prefix truncation).
 */

#ifndef RISKENGINE_DATA_RETURN_SERIES_HPP
#define RISKENGINE_DATA_RETURN_SERIES_HPP

#include <map>
#include <string>
#include <vector>

namespace riskengine
{
    namespace data
    {

        /**
         * @class ReturnSeries
         * @brief Identified sequence of daily fractional returns.
         *
         * Immutable after construction. All accessors are const.
         */
        class ReturnSeries
        {
        public:
            /**
             * @brief Construct a series.
             * @param id Asset or benchmark identifier (non-empty).
             * @param returns Daily fractional returns, oldest first.
             * @throws std::invalid_argument if id is empty.
             */
            ReturnSeries(std::string id, std::vector<double> returns);

            ~ReturnSeries() = default;

            const std::string &id() const { return id_; }

            const std::vector<double> &values() const { return returns_; }

            size_t size() const { return returns_.size(); }

            bool empty() const { return returns_.empty(); }

            double operator[](size_t t) const { return returns_[t]; }

            /**
             * @brief Trailing window of the series.
             * @param window_days Number of most recent observations to keep.
             *        Values <= 0 or larger than the series keep everything.
             * @return New series with the same identifier.
             */
            ReturnSeries tail(int window_days) const;

        private:
            std::string id_;
            std::vector<double> returns_;
        };

        /**
         * @struct AssetMetadata
         * @brief Presentation-only attributes of an asset.
         */
        struct AssetMetadata
        {
            std::string label; ///< Human-readable name
            std::string color; ///< Display color, e.g. "#2563eb"
        };

        /**
         * @class AssetUniverse
         * @brief Ordered set of asset return series with unique identifiers.
         *
         * Usage:
         * @code
         *   AssetUniverse universe({ReturnSeries("MSFT", msft),
         *                           ReturnSeries("GLD", gld)});
         *   size_t idx = universe.index_of("GLD");
         *   const auto &gld_returns = universe[idx].values();
         * @endcode
         *
         * Thread safety: Instances are immutable after construction.
         */
        class AssetUniverse
        {
        public:
            /**
             * @brief Construct from an ordered list of series.
             * @param assets Asset series in matrix/weight order.
             * @param metadata Optional display metadata keyed by identifier.
             * @throws std::invalid_argument if assets is empty, or identifiers
             *         are duplicated, or metadata names an unknown identifier.
             */
            explicit AssetUniverse(std::vector<ReturnSeries> assets,
                                   std::map<std::string, AssetMetadata> metadata = {});

            ~AssetUniverse() = default;

            /** @brief Number of assets (N). */
            size_t size() const { return assets_.size(); }

            const ReturnSeries &operator[](size_t i) const { return assets_[i]; }

            /**
             * @brief Bounds-checked access.
             * @throws std::out_of_range if i >= size().
             */
            const ReturnSeries &at(size_t i) const;

            /**
             * @brief Position of an identifier in universe order.
             * @throws std::invalid_argument if the identifier is unknown.
             */
            size_t index_of(const std::string &id) const;

            bool contains(const std::string &id) const;

            /** @brief Identifiers in universe order. */
            std::vector<std::string> identifiers() const;

            const std::vector<ReturnSeries> &assets() const { return assets_; }

            /**
             * @brief Display metadata for an asset.
             * @return Metadata, or a record with the identifier as label if none
             *         was supplied.
             */
            AssetMetadata metadata(const std::string &id) const;

            /**
             * @brief Length of the shortest series in the universe.
             */
            size_t min_length() const;

            /**
             * @brief Whether every series has the same length.
             */
            bool is_aligned() const;

            /**
             * @brief Trailing window applied to every asset.
             * @param window_days See ReturnSeries::tail.
             * @return New universe; metadata is carried over.
             */
            AssetUniverse tail(int window_days) const;

        private:
            std::vector<ReturnSeries> assets_;
            std::map<std::string, AssetMetadata> metadata_;
        };

    } // namespace data
} // namespace riskengine

#endif // RISKENGINE_DATA_RETURN_SERIES_HPP
