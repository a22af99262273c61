#ifndef URL_QUERY_PARAMS_HPP
#define URL_QUERY_PARAMS_HPP

/**
 * @file QueryParams.hpp
 *
 * This module declares the Url::QueryParams class and the types
 * of the keys and values it holds.
 *
 * © 2018 by Richard Walters
 */

#include <initializer_list>
#include <memory>
#include <stddef.h>
#include <string>
#include <utility>
#include <vector>

namespace Url {

    /**
     * This is one decoded key:value item of a query.  A value can be
     * absent (the key appears without '='), which is different
     * from a value that is present but empty.
     */
    struct QueryParam {
        /**
         * This is the decoded key.
         */
        std::string key;

        /**
         * This indicates whether or not the key has a value.
         */
        bool hasValue = false;

        /**
         * This is the decoded value, if the key has one.
         */
        std::string value;

        /**
         * This constructs an item with an empty key and no value.
         */
        QueryParam() = default;

        /**
         * This constructs an item with no value.
         *
         * @param[in] key
         *     This is the key of the item.
         */
        explicit QueryParam(const std::string& key);

        /**
         * This constructs an item with a value.
         *
         * @param[in] key
         *     This is the key of the item.
         *
         * @param[in] value
         *     This is the value of the item.
         */
        QueryParam(
            const std::string& key,
            const std::string& value
        );

        /**
         * This is the equality comparison operator for the structure.
         *
         * @param[in] other
         *     This is the other item to which to compare this item.
         *
         * @return
         *     An indication of whether or not the two items are
         *     equal is returned.
         */
        bool operator==(const QueryParam& other) const;

        /**
         * This is the inequality comparison operator for the structure.
         *
         * @param[in] other
         *     This is the other item to which to compare this item.
         *
         * @return
         *     An indication of whether or not the two items are
         *     not equal is returned.
         */
        bool operator!=(const QueryParam& other) const;
    };

    /**
     * This is what can be given as the value of a query key:
     * nothing (no value), a single value, or a list of values.
     * A list of values always means that many separate items with
     * the same key, never one item whose value is a list.
     */
    class QueryValue {
        // Public methods
    public:
        /**
         * This constructs the absence of a value.
         */
        QueryValue();

        /**
         * This constructs a single value.
         *
         * @param[in] value
         *     This is the value.
         */
        QueryValue(const char* value);

        /**
         * This constructs a single value.
         *
         * @param[in] value
         *     This is the value.
         */
        QueryValue(const std::string& value);

        /**
         * This constructs a list of values.
         *
         * @param[in] values
         *     These are the values.
         */
        QueryValue(std::initializer_list< std::string > values);

        /**
         * This constructs a list of values.
         *
         * @param[in] values
         *     These are the values.
         */
        QueryValue(const std::vector< std::string >& values);

        /**
         * This method returns an indication of whether or not
         * this is a list of values.
         *
         * @return
         *     An indication of whether or not this is
         *     a list of values is returned.
         */
        bool IsList() const;

        /**
         * This method returns the items this value stands for,
         * when given with the given key.
         *
         * @param[in] key
         *     This is the key to use for the items.
         *
         * @return
         *     One item is returned for a single value or no value.
         *     One item per value is returned for a list of values.
         */
        std::vector< QueryParam > ToItems(const std::string& key) const;

        // Private properties
    private:
        /**
         * This indicates whether or not this is a list of values.
         */
        bool isList_ = false;

        /**
         * This indicates whether or not there is a single value.
         */
        bool hasValue_ = false;

        /**
         * These are the values.  A single value is kept as
         * the only element.
         */
        std::vector< std::string > values_;
    };

    /**
     * This is a key with the value(s) to use for the key.
     */
    typedef std::pair< std::string, QueryValue > QueryEntry;

    /**
     * This class is an ordered multi-valued mapping of decoded query
     * keys to decoded values.  Items keep the order in which they
     * were added, and one key can have any number of values.
     *
     * The mapping is one-dimensional: whenever a list of values is
     * given for a key, it's treated as that many separate items.
     */
    class QueryParams {
        // Lifecycle management
    public:
        ~QueryParams() noexcept;
        QueryParams(const QueryParams& other);
        QueryParams(QueryParams&&) noexcept;
        QueryParams& operator=(const QueryParams& other);
        QueryParams& operator=(QueryParams&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        QueryParams();

        /**
         * This constructs the mapping by adding the given entries.
         *
         * @param[in] entries
         *     These are the entries to add.
         */
        QueryParams(std::initializer_list< QueryEntry > entries);

        /**
         * This is the equality comparison operator for the class.
         * Two mappings are equal if they have the same items
         * in the same order.
         *
         * @param[in] other
         *     This is the other mapping to which to compare this one.
         *
         * @return
         *     An indication of whether or not the two mappings are
         *     equal is returned.
         */
        bool operator==(const QueryParams& other) const;

        /**
         * This is the inequality comparison operator for the class.
         *
         * @param[in] other
         *     This is the other mapping to which to compare this one.
         *
         * @return
         *     An indication of whether or not the two mappings are
         *     not equal is returned.
         */
        bool operator!=(const QueryParams& other) const;

        /**
         * This method appends items with the given key to the end
         * of the mapping, one per given value.  An empty list
         * of values adds nothing.
         *
         * @param[in] key
         *     This is the key of the items to add.
         *
         * @param[in] value
         *     This is the value (or values) to add.
         */
        void Add(
            const std::string& key,
            const QueryValue& value = QueryValue()
        );

        /**
         * This method appends the given item to the end of the mapping.
         *
         * @param[in] item
         *     This is the item to add.
         */
        void Add(const QueryParam& item);

        /**
         * This method replaces the values of the given key.
         * Existing items of the key are updated in place, in order.
         * Extra values are added at the end of the mapping, and
         * existing items beyond the number of values are removed.
         * An empty list of values removes the key.
         *
         * @param[in] key
         *     This is the key whose values to replace.
         *
         * @param[in] value
         *     This is the value (or values) to give the key.
         */
        void Set(
            const std::string& key,
            const QueryValue& value = QueryValue()
        );

        /**
         * This method returns an indication of whether or not
         * the mapping has any items with the given key.
         *
         * @param[in] key
         *     This is the key to look for.
         *
         * @return
         *     An indication of whether or not the mapping has
         *     the key is returned.
         */
        bool Has(const std::string& key) const;

        /**
         * This method returns the value of the first item
         * with the given key.
         *
         * @param[in] key
         *     This is the key to look up.
         *
         * @param[in] defaultValue
         *     This is returned if the key isn't in the mapping
         *     or its first item has no value.
         *
         * @return
         *     The value of the first item with the key is returned.
         */
        std::string Get(
            const std::string& key,
            const std::string& defaultValue = ""
        ) const;

        /**
         * This method returns all items with the given key, in order.
         *
         * @param[in] key
         *     This is the key to look up.
         *
         * @return
         *     The items with the key are returned.
         */
        std::vector< QueryParam > GetAll(const std::string& key) const;

        /**
         * This method removes all items with the given key.
         *
         * @param[in] key
         *     This is the key to remove.
         *
         * @return
         *     An indication of whether or not any items
         *     were removed is returned.
         */
        bool Remove(const std::string& key);

        /**
         * This method removes the last item matching the given item
         * (same key, and same value or absence of value).
         *
         * @param[in] item
         *     This is the item to remove.
         *
         * @return
         *     An indication of whether or not an item
         *     was removed is returned.
         */
        bool RemoveItem(const QueryParam& item);

        /**
         * This method adopts the given entries, replacing the values
         * of keys the mapping already has.
         *
         * For each key already in the mapping, the given values
         * replace the existing items of that key in place, in order,
         * up to the number of existing items.  Values left over are
         * added at the end of the mapping, as are values of keys
         * not yet in the mapping.  An empty list of values removes
         * the key.
         *
         * For example, updating [(1, -), (2, -)] with
         * [(1, 1), (2, 2), (1, 11)] results in [(1, 1), (2, 2), (1, 11)].
         *
         * @param[in] entries
         *     These are the entries to adopt.
         */
        void UpdateAll(const std::vector< QueryEntry >& entries);

        /**
         * This method returns all items of the mapping, in order.
         *
         * @return
         *     All items of the mapping are returned.
         */
        std::vector< QueryParam > AllItems() const;

        /**
         * This method returns the keys of the mapping, each once,
         * in the order in which they first appear.
         *
         * @return
         *     The keys of the mapping are returned.
         */
        std::vector< std::string > Keys() const;

        /**
         * This method returns the number of items in the mapping.
         *
         * @return
         *     The number of items in the mapping is returned.
         */
        size_t Size() const;

        /**
         * This method returns an indication of whether or not
         * the mapping has no items.
         *
         * @return
         *     An indication of whether or not the mapping
         *     has no items is returned.
         */
        bool IsEmpty() const;

        /**
         * This method removes all items from the mapping.
         */
        void Clear();

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

#endif /* URL_QUERY_PARAMS_HPP */
