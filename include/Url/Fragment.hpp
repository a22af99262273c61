#ifndef URL_FRAGMENT_HPP
#define URL_FRAGMENT_HPP

/**
 * @file Fragment.hpp
 *
 * This module declares the Url::Fragment class.
 *
 * © 2018 by Richard Walters
 */

#include "Parameter.hpp"
#include "Path.hpp"
#include "Query.hpp"
#include "Warnings.hpp"

#include <memory>
#include <string>
#include <vector>

namespace Url {

    /**
     * This class represents the fragment of a URL, which can itself
     * hold a path and a query, as in "#/some/path?with=query".
     */
    class Fragment {
        // Types
    public:
        /**
         * These are the things which can be added to a fragment.
         */
        struct AddArguments {
            /**
             * If present, this is added to the path of the fragment.
             */
            Parameter< PathInput > path;

            /**
             * If present, these are added to the query of the fragment.
             */
            Parameter< QueryInput > args;
        };

        /**
         * These are the things which can be set in a fragment.
         */
        struct SetArguments {
            /**
             * If present, this replaces the path of the fragment.
             */
            Parameter< PathInput > path;

            /**
             * If present, these replace the query of the fragment.
             */
            Parameter< QueryInput > args;

            /**
             * If present, this sets whether or not a '?' is put
             * between the path and the query of the fragment.
             */
            Parameter< bool > separator;
        };

        /**
         * These are the things which can be removed from a fragment.
         */
        struct RemoveArguments {
            /**
             * This indicates whether or not to clear the whole fragment.
             */
            bool fragment = false;

            /**
             * This indicates whether or not to clear the path.
             */
            bool entirePath = false;

            /**
             * If present, this is removed from the end of the path.
             */
            Parameter< PathInput > path;

            /**
             * These are query keys to remove.
             */
            std::vector< std::string > args;

            /**
             * These are query key:value items to remove.
             */
            std::vector< QueryParam > argItems;

            /**
             * This indicates whether or not to clear the query.
             */
            bool query = false;
        };

        // Lifecycle management
    public:
        ~Fragment() noexcept;
        Fragment(const Fragment& other);
        Fragment(Fragment&&) noexcept;
        Fragment& operator=(const Fragment& other);
        Fragment& operator=(Fragment&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.  It makes an empty fragment.
         */
        Fragment();

        /**
         * This constructs the fragment by loading the given string.
         *
         * @param[in] fragment
         *     This is the encoded fragment, without the leading '#'.
         *
         * @param[in] strict
         *     This indicates whether or not to warn about fragment
         *     strings that are not correctly percent-encoded.
         */
        explicit Fragment(
            const std::string& fragment,
            bool strict = false
        );

        /**
         * This is the equality comparison operator for the class.
         *
         * @param[in] other
         *     This is the other fragment to which to compare this one.
         *
         * @return
         *     An indication of whether or not the two fragments are
         *     equal is returned.
         */
        bool operator==(const Fragment& other) const;

        /**
         * This is the inequality comparison operator for the class.
         *
         * @param[in] other
         *     This is the other fragment to which to compare this one.
         *
         * @return
         *     An indication of whether or not the two fragments are
         *     not equal is returned.
         */
        bool operator!=(const Fragment& other) const;

        /**
         * This method replaces the path and query of the fragment
         * with the ones in the given string.
         *
         * The string is split at its first '?' only if what follows
         * contains '='.  Otherwise the whole string is a query if it
         * contains '=' and no '?', or else a path.  So "a?b=c" has
         * path "a" and query "b=c", while "a?b?" is just a path.
         *
         * @param[in] fragment
         *     This is the encoded fragment, without the leading '#'.
         *
         * @return
         *     The fragment is returned.
         */
        Fragment& Load(const std::string& fragment);

        /**
         * This method adds to the path and query of the fragment.
         *
         * @param[in] arguments
         *     These are the things to add.
         *
         * @return
         *     The fragment is returned.
         */
        Fragment& Add(const AddArguments& arguments);

        /**
         * This method replaces the path, the query, or the separator
         * setting of the fragment.
         *
         * @param[in] arguments
         *     These are the things to set.
         *
         * @return
         *     The fragment is returned.
         */
        Fragment& Set(const SetArguments& arguments);

        /**
         * This method removes things from the fragment.
         *
         * @param[in] arguments
         *     These are the things to remove.
         *
         * @return
         *     The fragment is returned.
         */
        Fragment& Remove(const RemoveArguments& arguments);

        /**
         * This method clears the path and query of the fragment.
         *
         * @return
         *     The fragment is returned.
         */
        Fragment& Clear();

        /**
         * This method gives access to the path of the fragment.
         *
         * @return
         *     The path of the fragment is returned.
         */
        Path& GetPath();

        /**
         * This method gives access to the path of the fragment.
         *
         * @return
         *     The path of the fragment is returned.
         */
        const Path& GetPath() const;

        /**
         * This method gives access to the query of the fragment.
         *
         * @return
         *     The query of the fragment is returned.
         */
        Query& GetQuery();

        /**
         * This method gives access to the query of the fragment.
         *
         * @return
         *     The query of the fragment is returned.
         */
        const Query& GetQuery() const;

        /**
         * This method returns whether or not a '?' is put between
         * the path and the query of the fragment when both are there.
         *
         * @return
         *     An indication of whether or not the separator
         *     is used is returned.
         */
        bool HasSeparator() const;

        /**
         * This method sets whether or not a '?' is put between
         * the path and the query of the fragment when both are there.
         *
         * @param[in] separator
         *     This indicates whether or not to use the separator.
         */
        void SetSeparator(bool separator);

        /**
         * This method returns an indication of whether or not
         * the fragment has neither a path nor a query.
         *
         * @return
         *     An indication of whether or not the fragment
         *     is empty is returned.
         */
        bool IsEmpty() const;

        void SetStrict(bool strict);
        bool IsStrict() const;
        void SetWarningDelegate(WarningDelegate warningDelegate);

        /**
         * This method renders the fragment as a string,
         * without the leading '#'.
         *
         * @return
         *     The encoded fragment is returned.
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

#endif /* URL_FRAGMENT_HPP */
