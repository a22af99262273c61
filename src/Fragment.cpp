/**
 * @file Fragment.cpp
 *
 * This module contains the implementation of the Url::Fragment class.
 *
 * © 2018 by Richard Walters
 */

#include <Url/Fragment.hpp>

namespace Url {

    /**
     * This contains the private properties of a Fragment instance.
     */
    struct Fragment::Impl {
        /**
         * This is the path part of the fragment.
         */
        Path path;

        /**
         * This is the query part of the fragment.
         */
        Query query;

        /**
         * This indicates whether or not a '?' is put between
         * the path and the query when both are there.
         */
        bool separator = true;
    };

    Fragment::~Fragment() noexcept = default;
    Fragment::Fragment(const Fragment& other)
        : impl_(new Impl(*other.impl_))
    {
    }
    Fragment::Fragment(Fragment&&) noexcept = default;
    Fragment& Fragment::operator=(const Fragment& other) {
        if (this != &other) {
            *impl_ = *other.impl_;
        }
        return *this;
    }
    Fragment& Fragment::operator=(Fragment&&) noexcept = default;

    Fragment::Fragment()
        : impl_(new Impl)
    {
    }

    Fragment::Fragment(
        const std::string& fragment,
        bool strict
    )
        : impl_(new Impl)
    {
        SetStrict(strict);
        (void)Load(fragment);
    }

    bool Fragment::operator==(const Fragment& other) const {
        return (
            (impl_->path == other.impl_->path)
            && (impl_->query == other.impl_->query)
            && (impl_->separator == other.impl_->separator)
        );
    }

    bool Fragment::operator!=(const Fragment& other) const {
        return !(*this == other);
    }

    Fragment& Fragment::Load(const std::string& fragment) {
        (void)impl_->path.Clear();
        (void)impl_->query.Clear();
        const auto delimiter = fragment.find('?');
        if (delimiter == std::string::npos) {
            // Without a '?', the fragment is taken to be a path
            // unless it looks like a query.
            if (fragment.find('=') == std::string::npos) {
                (void)impl_->path.Load(fragment);
            } else {
                (void)impl_->query.Load(fragment);
            }
        } else {
            const auto query = fragment.substr(delimiter + 1);
            if (query.find('=') == std::string::npos) {
                (void)impl_->path.Load(fragment);
            } else {
                (void)impl_->path.Load(fragment.substr(0, delimiter));
                (void)impl_->query.Load(query);
            }
        }
        return *this;
    }

    Fragment& Fragment::Add(const AddArguments& arguments) {
        if (arguments.path.IsPresent()) {
            (void)impl_->path.Add(arguments.path.Get());
        }
        if (arguments.args.IsPresent()) {
            (void)impl_->query.Add(arguments.args.Get());
        }
        return *this;
    }

    Fragment& Fragment::Set(const SetArguments& arguments) {
        if (arguments.path.IsPresent()) {
            (void)impl_->path.Load(arguments.path.Get());
        }
        if (arguments.args.IsPresent()) {
            (void)impl_->query.Load(arguments.args.Get());
        }
        if (arguments.separator.IsPresent()) {
            impl_->separator = arguments.separator.Get();
        }
        return *this;
    }

    Fragment& Fragment::Remove(const RemoveArguments& arguments) {
        if (arguments.fragment) {
            (void)Clear();
        }
        if (arguments.entirePath) {
            (void)impl_->path.Clear();
        } else if (arguments.path.IsPresent()) {
            (void)impl_->path.Remove(arguments.path.Get());
        }
        if (arguments.query) {
            (void)impl_->query.Clear();
        } else {
            (void)impl_->query.RemoveKeys(arguments.args);
            (void)impl_->query.RemoveItems(arguments.argItems);
        }
        return *this;
    }

    Fragment& Fragment::Clear() {
        return Load("");
    }

    Path& Fragment::GetPath() {
        return impl_->path;
    }

    const Path& Fragment::GetPath() const {
        return impl_->path;
    }

    Query& Fragment::GetQuery() {
        return impl_->query;
    }

    const Query& Fragment::GetQuery() const {
        return impl_->query;
    }

    bool Fragment::HasSeparator() const {
        return impl_->separator;
    }

    void Fragment::SetSeparator(bool separator) {
        impl_->separator = separator;
    }

    bool Fragment::IsEmpty() const {
        return (
            impl_->path.GenerateString().empty()
            && impl_->query.IsEmpty()
        );
    }

    void Fragment::SetStrict(bool strict) {
        impl_->path.SetStrict(strict);
        impl_->query.SetStrict(strict);
    }

    bool Fragment::IsStrict() const {
        return impl_->path.IsStrict();
    }

    void Fragment::SetWarningDelegate(WarningDelegate warningDelegate) {
        impl_->path.SetWarningDelegate(warningDelegate);
        impl_->query.SetWarningDelegate(warningDelegate);
    }

    std::string Fragment::GenerateString() const {
        auto path = impl_->path.GenerateString();
        const auto query = impl_->query.GenerateString();

        // A '?' in the path can't be mistaken for the separator
        // if no separator follows, so it's left as it is.
        if (
            !path.empty()
            && (
                query.empty()
                || !impl_->separator
            )
        ) {
            size_t position = 0;
            while ((position = path.find("%3F", position)) != std::string::npos) {
                (void)path.replace(position, 3, "?");
                ++position;
            }
        }

        if (
            !path.empty()
            && !query.empty()
        ) {
            return path + (impl_->separator ? "?" : "") + query;
        }
        return path + query;
    }

}
