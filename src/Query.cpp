/**
 * @file Query.cpp
 *
 * This module contains the implementation of the Url::Query class
 * and the Url::QueryInput class.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterSet.hpp"
#include "CharacterSets.hpp"
#include "PercentEncoding.hpp"
#include "PublishWarning.hpp"

#include <Url/Codec.hpp>
#include <Url/Query.hpp>

namespace {

    /**
     * This function returns the characters of the given string
     * which may be left unencoded in a query element.
     *
     * @param[in] dontQuote
     *     These are the characters the caller wants left unencoded.
     *
     * @param[in] valid
     *     These are the characters which may appear unencoded
     *     in the query element.
     *
     * @param[in] quotePlus
     *     This indicates whether or not spaces are rendered as '+',
     *     in which case a literal '+' must always be encoded.
     *
     * @return
     *     The characters which may be left unencoded are returned.
     */
    std::string FilterDontQuote(
        const std::string& dontQuote,
        const Url::CharacterSet& valid,
        bool quotePlus
    ) {
        std::string filtered;
        for (const auto c: dontQuote) {
            if (
                valid.Contains(c)
                && (c != '&')
                && (
                    !quotePlus
                    || (c != '+')
                )
            ) {
                filtered.push_back(c);
            }
        }
        return filtered;
    }

    /**
     * This function percent-encodes the given query element.
     *
     * @param[in] element
     *     This is the decoded key or value to encode.
     *
     * @param[in] safe
     *     These are the characters to leave unencoded.
     *
     * @param[in] quotePlus
     *     This indicates whether spaces are rendered as '+'
     *     (if true) or as "%20" (if false).
     *
     * @return
     *     The encoded element is returned.
     */
    std::string EncodeQueryElement(
        const std::string& element,
        const Url::CharacterSet& safe,
        bool quotePlus
    ) {
        auto encoded = Url::EncodeElement(element, safe);
        if (quotePlus) {
            // Every '%' of the output starts an encoding, so "%20"
            // only ever stands for a space here.
            size_t position = 0;
            while ((position = encoded.find("%20", position)) != std::string::npos) {
                (void)encoded.replace(position, 3, "+");
                ++position;
            }
        }
        return encoded;
    }

    /**
     * This function renders the given items as a query string.
     *
     * @param[in] items
     *     These are the items to render.
     *
     * @param[in] delimiter
     *     This is put between items.
     *
     * @param[in] quotePlus
     *     This indicates whether spaces are rendered as '+'
     *     (if true) or as "%20" (if false).
     *
     * @param[in] dontQuote
     *     These are characters to leave unencoded, where allowed.
     *
     * @return
     *     The query string is returned.
     */
    std::string EncodeItems(
        const std::vector< Url::QueryParam >& items,
        const std::string& delimiter,
        bool quotePlus,
        const std::string& dontQuote
    ) {
        const Url::CharacterSet keySafe{
            Url::CharacterSets::QueryKeySafe(),
            Url::CharacterSet(
                FilterDontQuote(dontQuote, Url::CharacterSets::ValidQueryKey(), quotePlus)
            )
        };
        const Url::CharacterSet valueSafe{
            Url::CharacterSets::QueryValueSafe(),
            Url::CharacterSet(
                FilterDontQuote(dontQuote, Url::CharacterSets::ValidQueryValue(), quotePlus)
            )
        };
        std::string query;
        bool first = true;
        for (const auto& item: items) {
            if (!first) {
                query += delimiter;
            }
            first = false;
            query += EncodeQueryElement(item.key, keySafe, quotePlus);
            if (item.hasValue) {
                query += '=';
                query += EncodeQueryElement(item.value, valueSafe, quotePlus);
            }
        }
        return query;
    }

}

namespace Url {

    QueryInput::QueryInput() = default;

    QueryInput::QueryInput(const char* query)
        : form_(Form::EncodedString)
        , encodedString_(query)
    {
    }

    QueryInput::QueryInput(const std::string& query)
        : form_(Form::EncodedString)
        , encodedString_(query)
    {
    }

    QueryInput::QueryInput(std::initializer_list< QueryEntry > entries)
        : entries_(entries)
    {
    }

    QueryInput::QueryInput(const std::vector< QueryEntry >& entries)
        : entries_(entries)
    {
    }

    QueryInput::QueryInput(const std::map< std::string, QueryValue >& entries)
        : entries_(entries.begin(), entries.end())
    {
    }

    QueryInput::QueryInput(const QueryParams& params)
        : form_(Form::Params)
        , items_(params.AllItems())
    {
    }

    QueryInput::Form QueryInput::GetForm() const {
        return form_;
    }

    const std::string& QueryInput::GetEncodedString() const {
        return encodedString_;
    }

    const std::vector< QueryEntry >& QueryInput::GetEntries() const {
        return entries_;
    }

    const std::vector< QueryParam >& QueryInput::GetItems() const {
        return items_;
    }

    /**
     * This contains the private properties of a Query instance.
     */
    struct Query::Impl {
        // Properties

        /**
         * These are the items of the query.
         */
        QueryParams params;

        /**
         * This indicates whether or not to warn about query strings
         * that are not correctly percent-encoded.
         */
        bool strict = false;

        /**
         * This is the function to call to deliver warnings.
         */
        WarningDelegate warningDelegate;

        // Methods

        /**
         * This method breaks the given encoded query string into
         * decoded items, warning (in strict mode) if any key or value
         * is not correctly percent-encoded.
         *
         * @param[in] query
         *     This is the encoded query string.
         *
         * @return
         *     The decoded items are returned.
         */
        std::vector< QueryParam > ItemsFromString(const std::string& query) const {
            std::vector< QueryParam > items;
            bool correctlyEncoded = true;
            size_t pairStart = 0;
            while (pairStart <= query.length()) {
                auto pairEnd = query.find('&', pairStart);
                if (pairEnd == std::string::npos) {
                    pairEnd = query.length();
                }
                const auto pair = query.substr(pairStart, pairEnd - pairStart);
                pairStart = pairEnd + 1;
                if (pair.empty()) {
                    continue;
                }
                const auto delimiter = pair.find('=');
                if (delimiter == std::string::npos) {
                    if (!IsValidEncodedQueryKey(pair)) {
                        correctlyEncoded = false;
                    }
                    items.emplace_back(PercentDecodePlus(pair));
                } else {
                    const auto key = pair.substr(0, delimiter);
                    const auto value = pair.substr(delimiter + 1);
                    if (
                        !IsValidEncodedQueryKey(key)
                        || !IsValidEncodedQueryValue(value)
                    ) {
                        correctlyEncoded = false;
                    }
                    items.emplace_back(
                        PercentDecodePlus(key),
                        PercentDecodePlus(value)
                    );
                }
            }
            if (
                strict
                && !correctlyEncoded
            ) {
                PublishWarning(
                    warningDelegate,
                    Warning::Type::Encoding,
                    (
                        "Improperly encoded query string received: '" + query
                        + "'. Proceeding, but did you mean '"
                        + EncodeItems(items, "&", true, "") + "'?"
                    )
                );
            }
            return items;
        }

        /**
         * This method returns the items of the given query input,
         * applying the one-dimensional rule to lists of values.
         *
         * @param[in] query
         *     This is the query input to break into items.
         *
         * @return
         *     The decoded items are returned.
         */
        std::vector< QueryParam > ItemsFromInput(const QueryInput& query) const {
            switch (query.GetForm()) {
                case QueryInput::Form::EncodedString: {
                    return ItemsFromString(query.GetEncodedString());
                }

                case QueryInput::Form::Params: {
                    return query.GetItems();
                }

                case QueryInput::Form::Entries:
                default: {
                    std::vector< QueryParam > items;
                    for (const auto& entry: query.GetEntries()) {
                        for (const auto& item: entry.second.ToItems(entry.first)) {
                            items.push_back(item);
                        }
                    }
                    return items;
                }
            }
        }

        /**
         * This method returns the entries of the given query input,
         * in the form accepted by QueryParams::UpdateAll.
         *
         * @param[in] query
         *     This is the query input to break into entries.
         *
         * @return
         *     The entries are returned.
         */
        std::vector< QueryEntry > EntriesFromInput(const QueryInput& query) const {
            if (query.GetForm() == QueryInput::Form::Entries) {
                return query.GetEntries();
            }
            std::vector< QueryEntry > entries;
            for (const auto& item: ItemsFromInput(query)) {
                if (item.hasValue) {
                    entries.emplace_back(item.key, QueryValue(item.value));
                } else {
                    entries.emplace_back(item.key, QueryValue());
                }
            }
            return entries;
        }
    };

    Query::~Query() noexcept = default;
    Query::Query(const Query& other)
        : impl_(new Impl(*other.impl_))
    {
    }
    Query::Query(Query&&) noexcept = default;
    Query& Query::operator=(const Query& other) {
        if (this != &other) {
            *impl_ = *other.impl_;
        }
        return *this;
    }
    Query& Query::operator=(Query&&) noexcept = default;

    Query::Query()
        : impl_(new Impl)
    {
    }

    Query::Query(
        const QueryInput& query,
        bool strict
    )
        : impl_(new Impl)
    {
        impl_->strict = strict;
        (void)Load(query);
    }

    bool Query::operator==(const Query& other) const {
        return (impl_->params == other.impl_->params);
    }

    bool Query::operator!=(const Query& other) const {
        return !(*this == other);
    }

    Query& Query::Load(const QueryInput& query) {
        const auto items = impl_->ItemsFromInput(query);
        impl_->params.Clear();
        for (const auto& item: items) {
            impl_->params.Add(item);
        }
        return *this;
    }

    Query& Query::Add(const QueryInput& query) {
        for (const auto& item: impl_->ItemsFromInput(query)) {
            impl_->params.Add(item);
        }
        return *this;
    }

    Query& Query::Set(const QueryInput& query) {
        impl_->params.UpdateAll(impl_->EntriesFromInput(query));
        return *this;
    }

    Query& Query::RemoveKeys(const std::vector< std::string >& keys) {
        for (const auto& key: keys) {
            (void)impl_->params.Remove(key);
        }
        return *this;
    }

    Query& Query::RemoveItems(const std::vector< QueryParam >& items) {
        for (const auto& item: items) {
            (void)impl_->params.RemoveItem(item);
        }
        return *this;
    }

    Query& Query::Clear() {
        impl_->params.Clear();
        return *this;
    }

    QueryParams& Query::GetParams() {
        return impl_->params;
    }

    const QueryParams& Query::GetParams() const {
        return impl_->params;
    }

    bool Query::IsEmpty() const {
        return impl_->params.IsEmpty();
    }

    void Query::SetStrict(bool strict) {
        impl_->strict = strict;
    }

    bool Query::IsStrict() const {
        return impl_->strict;
    }

    void Query::SetWarningDelegate(WarningDelegate warningDelegate) {
        impl_->warningDelegate = warningDelegate;
    }

    std::string Query::Encode(
        const std::string& delimiter,
        bool quotePlus,
        const std::string& dontQuote
    ) const {
        return EncodeItems(
            impl_->params.AllItems(),
            delimiter,
            quotePlus,
            dontQuote
        );
    }

    std::string Query::GenerateString() const {
        return Encode();
    }

}
