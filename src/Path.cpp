/**
 * @file Path.cpp
 *
 * This module contains the implementation of the Url::Path class.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterSets.hpp"
#include "PercentEncoding.hpp"
#include "PublishWarning.hpp"

#include <Url/Codec.hpp>
#include <Url/Errors.hpp>
#include <Url/Path.hpp>

namespace Url {

    PathInput::PathInput() = default;

    PathInput::PathInput(const char* path)
        : isString_(true)
        , string_(path)
    {
    }

    PathInput::PathInput(const std::string& path)
        : isString_(true)
        , string_(path)
    {
    }

    PathInput::PathInput(const std::vector< std::string >& segments)
        : segments_(segments)
    {
    }

    PathInput::PathInput(std::initializer_list< std::string > segments)
        : segments_(segments)
    {
    }

    PathInput::PathInput(const Path& path)
        : segments_(path.GetSegments())
    {
        if (path.IsAbsolute()) {
            (void)segments_.insert(segments_.begin(), "");
        }
    }

    bool PathInput::IsString() const {
        return isString_;
    }

    const std::string& PathInput::GetString() const {
        return string_;
    }

    const std::vector< std::string >& PathInput::GetSegments() const {
        return segments_;
    }

    /**
     * This contains the private properties of a Path instance.
     */
    struct Path::Impl {
        // Properties

        /**
         * These are the decoded segments of the path.  When the path
         * is absolute, the leading empty segment is not stored here.
         */
        std::vector< std::string > segments;

        /**
         * This indicates whether or not the path is absolute,
         * unless the owner forces it to be.
         */
        bool isAbsolute = false;

        /**
         * This is how the owner of the path controls
         * whether or not the path is absolute.
         */
        Absoluteness absoluteness = Absoluteness::Mutable;

        /**
         * This indicates whether or not to warn about path strings
         * that are not correctly percent-encoded.
         */
        bool strict = false;

        /**
         * This is the function to call to deliver warnings.
         */
        WarningDelegate warningDelegate;

        // Methods

        /**
         * This method returns an indication of whether or not
         * the owner of the path currently forces it to be absolute.
         *
         * @return
         *     An indication of whether or not the path
         *     is forced to be absolute is returned.
         */
        bool IsForcedAbsolute() const {
            return (
                (absoluteness == Absoluteness::ForcedAbsolute)
                && !segments.empty()
            );
        }

        /**
         * This method returns an indication of whether or not
         * the path is absolute.
         *
         * @return
         *     An indication of whether or not the path
         *     is absolute is returned.
         */
        bool IsAbsolute() const {
            return (
                IsForcedAbsolute()
                || isAbsolute
            );
        }

        /**
         * This method percent-encodes the given segments and
         * puts them together into a path string.
         *
         * @param[in] decodedSegments
         *     These are the segments to encode.
         *
         * @return
         *     The encoded path string is returned.
         */
        static std::string PathFromSegments(
            const std::vector< std::string >& decodedSegments
        ) {
            std::vector< std::string > encodedSegments;
            for (const auto& segment: decodedSegments) {
                encodedSegments.push_back(
                    EncodeElement(segment, CharacterSets::PcharNotPctEncoded())
                );
            }
            return JoinPath(encodedSegments);
        }

        /**
         * This method splits the given path string into segments
         * and decodes them, warning (in strict mode) if any segment
         * is not correctly percent-encoded.
         *
         * @param[in] path
         *     This is the path string to split.
         *
         * @return
         *     The decoded segments of the path are returned.
         */
        std::vector< std::string > SegmentsFromPath(const std::string& path) const {
            auto segments = SplitPath(path);
            bool correctlyEncoded = true;
            for (auto& segment: segments) {
                if (!IsValidEncodedPathSegment(segment)) {
                    correctlyEncoded = false;
                }
                segment = PercentDecode(segment);
            }
            if (
                strict
                && !correctlyEncoded
            ) {
                PublishWarning(
                    warningDelegate,
                    Warning::Type::Encoding,
                    (
                        "Improperly encoded path string received: '" + path
                        + "'. Proceeding, but did you mean '"
                        + PathFromSegments(segments) + "'?"
                    )
                );
            }
            return segments;
        }

        /**
         * This method returns the segments of the given path input,
         * decoding them if the input is a path string.
         *
         * @param[in] path
         *     This is the path input to break into segments.
         *
         * @return
         *     The decoded segments of the path are returned.
         */
        std::vector< std::string > SegmentsFromInput(const PathInput& path) const {
            if (path.IsString()) {
                return SegmentsFromPath(path.GetString());
            } else {
                return path.GetSegments();
            }
        }

        /**
         * This method replaces the path with the given segments.
         * An empty first segment makes the path absolute.
         *
         * @param[in] newSegments
         *     These are the new segments of the path.
         */
        void Adopt(std::vector< std::string > newSegments) {
            if (absoluteness == Absoluteness::ForcedAbsolute) {
                isAbsolute = !newSegments.empty();
            } else {
                isAbsolute = (
                    !newSegments.empty()
                    && newSegments[0].empty()
                );
            }
            if (
                isAbsolute
                && (newSegments.size() > 1)
                && newSegments[0].empty()
            ) {
                (void)newSegments.erase(newSegments.begin());
            }
            segments = std::move(newSegments);
        }
    };

    Path::~Path() noexcept = default;
    Path::Path(const Path& other)
        : impl_(new Impl(*other.impl_))
    {
        impl_->isAbsolute = other.impl_->IsAbsolute();
        impl_->absoluteness = Absoluteness::Mutable;
    }
    Path::Path(Path&&) noexcept = default;
    Path& Path::operator=(const Path& other) {
        if (this != &other) {
            const auto absoluteness = impl_->absoluteness;
            *impl_ = *other.impl_;
            impl_->isAbsolute = other.impl_->IsAbsolute();
            impl_->absoluteness = absoluteness;
        }
        return *this;
    }
    Path& Path::operator=(Path&& other) noexcept {
        if (this != &other) {
            const auto absoluteness = (
                (impl_ == nullptr)
                ? Absoluteness::Mutable
                : impl_->absoluteness
            );
            impl_ = std::move(other.impl_);
            if (impl_ != nullptr) {
                impl_->isAbsolute = impl_->IsAbsolute();
                impl_->absoluteness = absoluteness;
            }
        }
        return *this;
    }

    Path::Path()
        : impl_(new Impl)
    {
    }

    Path::Path(
        const PathInput& path,
        bool strict
    )
        : impl_(new Impl)
    {
        impl_->strict = strict;
        (void)Load(path);
    }

    bool Path::operator==(const Path& other) const {
        return (
            (impl_->segments == other.impl_->segments)
            && (impl_->IsAbsolute() == other.impl_->IsAbsolute())
        );
    }

    bool Path::operator!=(const Path& other) const {
        return !(*this == other);
    }

    Path& Path::Load(const PathInput& path) {
        if (
            path.IsString()
            && path.GetString().empty()
        ) {
            impl_->Adopt({});
        } else {
            impl_->Adopt(impl_->SegmentsFromInput(path));
        }
        return *this;
    }

    Path& Path::Add(const PathInput& path) {
        auto newSegments = impl_->SegmentsFromInput(path);

        // Preserve the opening '/' if there is nothing else yet.
        if (
            (impl_->segments.size() == 1)
            && impl_->segments[0].empty()
            && !newSegments.empty()
            && !newSegments[0].empty()
        ) {
            (void)newSegments.insert(newSegments.begin(), "");
        }

        auto segments = impl_->segments;
        if (
            impl_->IsAbsolute()
            && !segments.empty()
            && !segments[0].empty()
        ) {
            (void)segments.insert(segments.begin(), "");
        }
        impl_->Adopt(JoinPathSegments(segments, newSegments));
        return *this;
    }

    Path& Path::Set(const PathInput& path) {
        return Load(path);
    }

    Path& Path::Remove(const PathInput& path) {
        const auto segmentsToRemove = impl_->SegmentsFromInput(path);
        auto segments = impl_->segments;
        if (impl_->IsAbsolute()) {
            (void)segments.insert(segments.begin(), "");
        }
        impl_->Adopt(RemovePathSegments(segments, segmentsToRemove));
        return *this;
    }

    Path& Path::Clear() {
        impl_->Adopt({});
        return *this;
    }

    Path& Path::Normalize() {
        if (GenerateString().empty()) {
            return *this;
        }
        const auto isAbsolute = impl_->IsAbsolute();
        const auto isDirectory = IsDirectory();
        std::vector< std::string > components;
        for (const auto& segment: impl_->segments) {
            if (
                segment.empty()
                || (segment == ".")
            ) {
                continue;
            }
            if (
                (segment != "..")
                || (
                    !isAbsolute
                    && components.empty()
                )
                || (
                    !components.empty()
                    && (components.back() == "..")
                )
            ) {
                components.push_back(segment);
            } else if (!components.empty()) {
                components.pop_back();
            }
        }
        std::vector< std::string > normalized;
        if (isAbsolute) {
            normalized.push_back("");
        } else if (components.empty()) {
            components.push_back(".");
        }
        normalized.insert(normalized.end(), components.begin(), components.end());
        if (isDirectory) {
            normalized.push_back("");
        }
        impl_->Adopt(normalized);
        return *this;
    }

    std::vector< std::string > Path::GetSegments() const {
        return impl_->segments;
    }

    bool Path::IsAbsolute() const {
        return impl_->IsAbsolute();
    }

    void Path::SetAbsolute(bool isAbsolute) {
        if (impl_->IsForcedAbsolute()) {
            throw ImmutableStateError();
        }
        impl_->isAbsolute = isAbsolute;
    }

    bool Path::IsDirectory() const {
        return (
            impl_->segments.empty()
            || impl_->segments.back().empty()
        );
    }

    bool Path::IsFile() const {
        return !IsDirectory();
    }

    bool Path::IsEmpty() const {
        return impl_->segments.empty();
    }

    void Path::SetAbsoluteness(Absoluteness absoluteness) {
        impl_->absoluteness = absoluteness;
    }

    Path::Absoluteness Path::GetAbsoluteness() const {
        return impl_->absoluteness;
    }

    void Path::SetStrict(bool strict) {
        impl_->strict = strict;
    }

    bool Path::IsStrict() const {
        return impl_->strict;
    }

    void Path::SetWarningDelegate(WarningDelegate warningDelegate) {
        impl_->warningDelegate = warningDelegate;
    }

    std::string Path::GenerateString() const {
        const auto path = Impl::PathFromSegments(impl_->segments);
        if (impl_->IsAbsolute()) {
            return "/" + path;
        } else {
            return path;
        }
    }

}
