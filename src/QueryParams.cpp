/**
 * @file QueryParams.cpp
 *
 * This module contains the implementation of the Url::QueryParams class
 * and the types of the keys and values it holds.
 *
 * © 2018 by Richard Walters
 */

#include <algorithm>
#include <iterator>
#include <map>
#include <Url/QueryParams.hpp>

namespace Url {

    QueryParam::QueryParam(const std::string& key)
        : key(key)
    {
    }

    QueryParam::QueryParam(
        const std::string& key,
        const std::string& value
    )
        : key(key)
        , hasValue(true)
        , value(value)
    {
    }

    bool QueryParam::operator==(const QueryParam& other) const {
        return (
            (key == other.key)
            && (hasValue == other.hasValue)
            && (
                !hasValue
                || (value == other.value)
            )
        );
    }

    bool QueryParam::operator!=(const QueryParam& other) const {
        return !(*this == other);
    }

    QueryValue::QueryValue() = default;

    QueryValue::QueryValue(const char* value)
        : hasValue_(true)
        , values_(1, value)
    {
    }

    QueryValue::QueryValue(const std::string& value)
        : hasValue_(true)
        , values_(1, value)
    {
    }

    QueryValue::QueryValue(std::initializer_list< std::string > values)
        : isList_(true)
        , values_(values)
    {
    }

    QueryValue::QueryValue(const std::vector< std::string >& values)
        : isList_(true)
        , values_(values)
    {
    }

    bool QueryValue::IsList() const {
        return isList_;
    }

    std::vector< QueryParam > QueryValue::ToItems(const std::string& key) const {
        std::vector< QueryParam > items;
        if (isList_) {
            for (const auto& value: values_) {
                items.emplace_back(key, value);
            }
        } else if (hasValue_) {
            items.emplace_back(key, values_[0]);
        } else {
            items.emplace_back(key);
        }
        return items;
    }

    /**
     * This contains the private properties of a QueryParams instance.
     */
    struct QueryParams::Impl {
        // Properties

        /**
         * These are the items of the mapping, in order.
         */
        std::vector< QueryParam > items;

        // Methods

        /**
         * This method returns the number of items with the given key.
         *
         * @param[in] key
         *     This is the key to count.
         *
         * @return
         *     The number of items with the key is returned.
         */
        size_t Count(const std::string& key) const {
            return (size_t)std::count_if(
                items.begin(),
                items.end(),
                [&key](const QueryParam& item){
                    return (item.key == key);
                }
            );
        }

        /**
         * This method replaces the items with the given key by the
         * given items.  Existing items are overwritten in place;
         * extra items go at the end, and unused existing items
         * are removed.
         *
         * @param[in] key
         *     This is the key whose items to replace.
         *
         * @param[in] newItems
         *     These are the items to put in place.
         */
        void SetItems(
            const std::string& key,
            const std::vector< QueryParam >& newItems
        ) {
            size_t nextNewItem = 0;
            auto item = items.begin();
            while (item != items.end()) {
                if (item->key == key) {
                    if (nextNewItem < newItems.size()) {
                        *item = newItems[nextNewItem++];
                        ++item;
                    } else {
                        item = items.erase(item);
                    }
                } else {
                    ++item;
                }
            }
            while (nextNewItem < newItems.size()) {
                items.push_back(newItems[nextNewItem++]);
            }
        }
    };

    QueryParams::~QueryParams() noexcept = default;
    QueryParams::QueryParams(const QueryParams& other)
        : impl_(new Impl(*other.impl_))
    {
    }
    QueryParams::QueryParams(QueryParams&&) noexcept = default;
    QueryParams& QueryParams::operator=(const QueryParams& other) {
        if (this != &other) {
            *impl_ = *other.impl_;
        }
        return *this;
    }
    QueryParams& QueryParams::operator=(QueryParams&&) noexcept = default;

    QueryParams::QueryParams()
        : impl_(new Impl)
    {
    }

    QueryParams::QueryParams(std::initializer_list< QueryEntry > entries)
        : impl_(new Impl)
    {
        for (const auto& entry: entries) {
            Add(entry.first, entry.second);
        }
    }

    bool QueryParams::operator==(const QueryParams& other) const {
        return (impl_->items == other.impl_->items);
    }

    bool QueryParams::operator!=(const QueryParams& other) const {
        return !(*this == other);
    }

    void QueryParams::Add(
        const std::string& key,
        const QueryValue& value
    ) {
        for (const auto& item: value.ToItems(key)) {
            impl_->items.push_back(item);
        }
    }

    void QueryParams::Add(const QueryParam& item) {
        impl_->items.push_back(item);
    }

    void QueryParams::Set(
        const std::string& key,
        const QueryValue& value
    ) {
        impl_->SetItems(key, value.ToItems(key));
    }

    bool QueryParams::Has(const std::string& key) const {
        return (impl_->Count(key) > 0);
    }

    std::string QueryParams::Get(
        const std::string& key,
        const std::string& defaultValue
    ) const {
        for (const auto& item: impl_->items) {
            if (item.key == key) {
                return (item.hasValue ? item.value : defaultValue);
            }
        }
        return defaultValue;
    }

    std::vector< QueryParam > QueryParams::GetAll(const std::string& key) const {
        std::vector< QueryParam > items;
        for (const auto& item: impl_->items) {
            if (item.key == key) {
                items.push_back(item);
            }
        }
        return items;
    }

    bool QueryParams::Remove(const std::string& key) {
        const auto oldSize = impl_->items.size();
        impl_->SetItems(key, {});
        return (impl_->items.size() != oldSize);
    }

    bool QueryParams::RemoveItem(const QueryParam& item) {
        for (auto candidate = impl_->items.rbegin(); candidate != impl_->items.rend(); ++candidate) {
            if (*candidate == item) {
                (void)impl_->items.erase(std::next(candidate).base());
                return true;
            }
        }
        return false;
    }

    void QueryParams::UpdateAll(const std::vector< QueryEntry >& entries) {
        // Sort the given items into those replacing existing items
        // and those left over to be added at the end.
        std::map< std::string, std::vector< QueryParam > > replacements;
        std::vector< QueryParam > leftovers;
        for (const auto& entry: entries) {
            const auto& key = entry.first;
            const auto newItems = entry.second.ToItems(key);
            if (
                entry.second.IsList()
                && newItems.empty()
            ) {
                replacements[key].clear();
                (void)leftovers.erase(
                    std::remove_if(
                        leftovers.begin(),
                        leftovers.end(),
                        [&key](const QueryParam& leftover){
                            return (leftover.key == key);
                        }
                    ),
                    leftovers.end()
                );
                continue;
            }
            const auto existingCount = impl_->Count(key);
            for (const auto& newItem: newItems) {
                auto replacement = replacements.find(key);
                if (
                    (existingCount > 0)
                    && (
                        (replacement == replacements.end())
                        || replacement->second.empty()
                    )
                ) {
                    replacements[key] = {newItem};
                } else if (
                    (existingCount > 0)
                    && (replacement->second.size() < existingCount)
                ) {
                    replacement->second.push_back(newItem);
                } else {
                    leftovers.push_back(newItem);
                }
            }
        }

        // Replace existing items first, then add the leftovers.
        for (const auto& replacement: replacements) {
            impl_->SetItems(replacement.first, replacement.second);
        }
        for (const auto& leftover: leftovers) {
            impl_->items.push_back(leftover);
        }
    }

    std::vector< QueryParam > QueryParams::AllItems() const {
        return impl_->items;
    }

    std::vector< std::string > QueryParams::Keys() const {
        std::vector< std::string > keys;
        for (const auto& item: impl_->items) {
            if (std::find(keys.begin(), keys.end(), item.key) == keys.end()) {
                keys.push_back(item.key);
            }
        }
        return keys;
    }

    size_t QueryParams::Size() const {
        return impl_->items.size();
    }

    bool QueryParams::IsEmpty() const {
        return impl_->items.empty();
    }

    void QueryParams::Clear() {
        impl_->items.clear();
    }

}
