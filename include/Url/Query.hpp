#ifndef URL_QUERY_HPP
#define URL_QUERY_HPP

/**
 * @file Query.hpp
 *
 * This module declares the Url::Query class and the Url::QueryInput
 * class used to hand queries to it.
 *
 * © 2018 by Richard Walters
 */

#include "QueryParams.hpp"
#include "Warnings.hpp"

#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Url {

    /**
     * This holds query items given to one of the methods of Query,
     * in one of these forms:
     * - an encoded query string, such as "a=1&b=2";
     * - a list of key:value entries, which may repeat keys;
     * - a map of keys to values;
     * - the items of another QueryParams mapping.
     *
     * Only items extracted from an encoded query string are decoded.
     */
    class QueryInput {
        // Types
    public:
        /**
         * These are the forms in which query items can be given.
         */
        enum class Form {
            /**
             * The items are in an encoded query string.
             */
            EncodedString,

            /**
             * The items are a list of key:value entries.
             */
            Entries,

            /**
             * The items are the items of a QueryParams mapping.
             */
            Params,
        };

        // Public methods
    public:
        /**
         * This constructs an input with no items.
         */
        QueryInput();

        /**
         * This constructs the input from an encoded query string.
         *
         * @param[in] query
         *     This is the encoded query string.
         */
        QueryInput(const char* query);

        /**
         * This constructs the input from an encoded query string.
         *
         * @param[in] query
         *     This is the encoded query string.
         */
        QueryInput(const std::string& query);

        /**
         * This constructs the input from a list of entries.
         *
         * @param[in] entries
         *     These are the entries.
         */
        QueryInput(std::initializer_list< QueryEntry > entries);

        /**
         * This constructs the input from a list of entries.
         *
         * @param[in] entries
         *     These are the entries.
         */
        QueryInput(const std::vector< QueryEntry >& entries);

        /**
         * This constructs the input from a map of keys to values.
         *
         * @param[in] entries
         *     These are the entries, in the order of their keys.
         */
        QueryInput(const std::map< std::string, QueryValue >& entries);

        /**
         * This constructs the input from the items
         * of a QueryParams mapping.
         *
         * @param[in] params
         *     This is the mapping holding the items.
         */
        QueryInput(const QueryParams& params);

        /**
         * This method returns the form in which the items were given.
         *
         * @return
         *     The form in which the items were given is returned.
         */
        Form GetForm() const;

        /**
         * This method returns the encoded query string,
         * if the items were given that way.
         *
         * @return
         *     The encoded query string is returned.
         */
        const std::string& GetEncodedString() const;

        /**
         * This method returns the entries, if the items were given
         * as a list of entries or as a map.
         *
         * @return
         *     The entries are returned.
         */
        const std::vector< QueryEntry >& GetEntries() const;

        /**
         * This method returns the items, if they were given
         * as a QueryParams mapping.
         *
         * @return
         *     The items are returned.
         */
        const std::vector< QueryParam >& GetItems() const;

        // Private properties
    private:
        /**
         * This is the form in which the items were given.
         */
        Form form_ = Form::Entries;

        /**
         * This is the encoded query string, if the items
         * were given that way.
         */
        std::string encodedString_;

        /**
         * These are the entries, if the items were given
         * as a list of entries or as a map.
         */
        std::vector< QueryEntry > entries_;

        /**
         * These are the items, if they were given
         * as a QueryParams mapping.
         */
        std::vector< QueryParam > items_;
    };

    /**
     * This class represents the query of a URL or of a URL fragment,
     * as an ordered multi-valued mapping of decoded keys to decoded
     * values, which is percent-encoded when the query is rendered.
     */
    class Query {
        // Lifecycle management
    public:
        ~Query() noexcept;
        Query(const Query& other);
        Query(Query&&) noexcept;
        Query& operator=(const Query& other);
        Query& operator=(Query&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.  It makes an empty query.
         */
        Query();

        /**
         * This constructs the query by loading the given items.
         *
         * @param[in] query
         *     These are the items to load.
         *
         * @param[in] strict
         *     This indicates whether or not to warn about query strings
         *     that are not correctly percent-encoded.
         */
        explicit Query(
            const QueryInput& query,
            bool strict = false
        );

        /**
         * This is the equality comparison operator for the class.
         *
         * @param[in] other
         *     This is the other query to which to compare this query.
         *
         * @return
         *     An indication of whether or not the two queries are
         *     equal is returned.
         */
        bool operator==(const Query& other) const;

        /**
         * This is the inequality comparison operator for the class.
         *
         * @param[in] other
         *     This is the other query to which to compare this query.
         *
         * @return
         *     An indication of whether or not the two queries are
         *     not equal is returned.
         */
        bool operator!=(const Query& other) const;

        /**
         * This method replaces all items of the query
         * with the given items.
         *
         * @param[in] query
         *     These are the items to adopt.
         *
         * @return
         *     The query is returned.
         */
        Query& Load(const QueryInput& query);

        /**
         * This method appends the given items to the query.
         *
         * @param[in] query
         *     These are the items to add.
         *
         * @return
         *     The query is returned.
         */
        Query& Add(const QueryInput& query);

        /**
         * This method adopts the given items, replacing the values
         * of keys the query already has, as described for
         * QueryParams::UpdateAll.
         *
         * @param[in] query
         *     These are the items to adopt.
         *
         * @return
         *     The query is returned.
         */
        Query& Set(const QueryInput& query);

        /**
         * This method removes all items with the given keys.
         *
         * @param[in] keys
         *     These are the keys to remove.
         *
         * @return
         *     The query is returned.
         */
        Query& RemoveKeys(const std::vector< std::string >& keys);

        /**
         * This method removes the given key:value items.
         *
         * @param[in] items
         *     These are the items to remove.
         *
         * @return
         *     The query is returned.
         */
        Query& RemoveItems(const std::vector< QueryParam >& items);

        /**
         * This method removes all items of the query.
         *
         * @return
         *     The query is returned.
         */
        Query& Clear();

        /**
         * This method gives access to the items of the query.
         *
         * @return
         *     The items of the query are returned.
         */
        QueryParams& GetParams();

        /**
         * This method gives access to the items of the query.
         *
         * @return
         *     The items of the query are returned.
         */
        const QueryParams& GetParams() const;

        /**
         * This method returns an indication of whether or not
         * the query has no items.
         *
         * @return
         *     An indication of whether or not the query
         *     has no items is returned.
         */
        bool IsEmpty() const;

        /**
         * This method sets whether or not to warn about query strings
         * that are not correctly percent-encoded.
         *
         * @param[in] strict
         *     This indicates whether or not to warn about query strings
         *     that are not correctly percent-encoded.
         */
        void SetStrict(bool strict);

        /**
         * This method returns whether or not the query warns about
         * query strings that are not correctly percent-encoded.
         *
         * @return
         *     An indication of whether or not the query is
         *     in strict mode is returned.
         */
        bool IsStrict() const;

        /**
         * This method sets the function to call to deliver warnings.
         *
         * @param[in] warningDelegate
         *     This is the function to call to deliver warnings.
         *     If none is set, warnings are logged.
         */
        void SetWarningDelegate(WarningDelegate warningDelegate);

        /**
         * This method renders the query as a string.
         *
         * Items are rendered in order, as "key=value", or just "key"
         * for an item without a value, separated by the delimiter.
         *
         * @param[in] delimiter
         *     This is put between items.
         *
         * @param[in] quotePlus
         *     This indicates whether spaces are rendered as '+'
         *     (if true) or as "%20" (if false).
         *
         * @param[in] dontQuote
         *     These are characters to leave unencoded that would
         *     otherwise be encoded.  Characters that would make the
         *     query ambiguous, such as '&' or '#' (or '=' in keys,
         *     or '+' when spaces are rendered as '+'), are
         *     encoded anyway.
         *
         * @return
         *     The encoded query string is returned.
         */
        std::string Encode(
            const std::string& delimiter = "&",
            bool quotePlus = true,
            const std::string& dontQuote = ""
        ) const;

        /**
         * This method renders the query as a string,
         * using the default encoding options.
         *
         * @return
         *     The encoded query string is returned.
         */
        std::string GenerateString() const;

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::unique_ptr< Impl > impl_;
    };

}

#endif /* URL_QUERY_HPP */
