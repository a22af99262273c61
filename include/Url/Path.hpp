#ifndef URL_PATH_HPP
#define URL_PATH_HPP

/**
 * @file Path.hpp
 *
 * This module declares the Url::Path class and the Url::PathInput
 * class used to hand paths to it.
 *
 * © 2018 by Richard Walters
 */

#include "Warnings.hpp"

#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace Url {

    class Path;
    class Url;

    /**
     * This holds a path given to one of the methods of Path,
     * either as a percent-encoded path string or as a list
     * of decoded segments.
     */
    class PathInput {
        // Public methods
    public:
        /**
         * This constructs an empty path.
         */
        PathInput();

        /**
         * This constructs the input from a percent-encoded path string.
         *
         * @param[in] path
         *     This is the path string, split on '/' when used.
         */
        PathInput(const char* path);

        /**
         * This constructs the input from a percent-encoded path string.
         *
         * @param[in] path
         *     This is the path string, split on '/' when used.
         */
        PathInput(const std::string& path);

        /**
         * This constructs the input from a list of segments,
         * which are taken as they are, without decoding.
         *
         * @param[in] segments
         *     These are the segments of the path.  An empty first
         *     segment makes the path absolute.
         */
        PathInput(const std::vector< std::string >& segments);

        /**
         * This constructs the input from a list of segments,
         * which are taken as they are, without decoding.
         *
         * @param[in] segments
         *     These are the segments of the path.  An empty first
         *     segment makes the path absolute.
         */
        PathInput(std::initializer_list< std::string > segments);

        /**
         * This constructs the input from the segments of another path,
         * with an empty first segment if that path is absolute.
         *
         * @param[in] path
         *     This is the path to copy.
         */
        PathInput(const Path& path);

        /**
         * This method returns an indication of whether or not
         * the input is a path string.
         *
         * @return
         *     An indication of whether or not the input
         *     is a path string is returned.
         */
        bool IsString() const;

        /**
         * This method returns the path string, if the input is one.
         *
         * @return
         *     The path string is returned.
         */
        const std::string& GetString() const;

        /**
         * This method returns the list of segments, if the input is one.
         *
         * @return
         *     The list of segments is returned.
         */
        const std::vector< std::string >& GetSegments() const;

        // Private properties
    private:
        /**
         * This indicates whether the input is a path string
         * or a list of segments.
         */
        bool isString_ = false;

        /**
         * This is the path string, if the input is one.
         */
        std::string string_;

        /**
         * This is the list of segments, if the input is one.
         */
        std::vector< std::string > segments_;
    };

    /**
     * This class represents the path of a URL or of a URL fragment,
     * as a list of decoded segments plus an indication of whether
     * or not the path is absolute (starts with a '/').
     *
     * A path whose last segment is empty ends with a '/'
     * and so names a directory.  Otherwise it names a file.
     *
     * Segments are kept decoded and are percent-encoded
     * only when the path is rendered as a string.
     */
    class Path {
        // Types
    public:
        /**
         * These are the ways the owner of a path can control
         * whether or not the path is absolute.
         */
        enum class Absoluteness {
            /**
             * The path is absolute or not as set by its users.
             */
            Mutable,

            /**
             * The path is always absolute once it has segments,
             * and whether or not it's absolute can't be changed
             * while it has segments.  URL paths are in this mode
             * while the URL has an authority.
             */
            ForcedAbsolute,
        };

        // Lifecycle management
    public:
        ~Path() noexcept;
        Path(const Path& other);
        Path(Path&&) noexcept;
        Path& operator=(const Path& other);
        Path& operator=(Path&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.  It makes an empty,
         * relative path.
         */
        Path();

        /**
         * This constructs the path by loading the given input.
         *
         * @param[in] path
         *     This is the path to load.
         *
         * @param[in] strict
         *     This indicates whether or not to warn about path strings
         *     that are not correctly percent-encoded.
         */
        explicit Path(
            const PathInput& path,
            bool strict = false
        );

        /**
         * This is the equality comparison operator for the class.
         *
         * @param[in] other
         *     This is the other path to which to compare this path.
         *
         * @return
         *     An indication of whether or not the two paths are
         *     equal is returned.
         */
        bool operator==(const Path& other) const;

        /**
         * This is the inequality comparison operator for the class.
         *
         * @param[in] other
         *     This is the other path to which to compare this path.
         *
         * @return
         *     An indication of whether or not the two paths are
         *     not equal is returned.
         */
        bool operator!=(const Path& other) const;

        /**
         * This method replaces the path with the given one.
         *
         * A path string is split on '/' and each piece is
         * percent-decoded.  A list of segments is taken as is.
         * An empty first segment makes the path absolute and is
         * dropped from the list of segments, unless it is the only one.
         *
         * @param[in] path
         *     This is the path to adopt.
         *
         * @return
         *     The path is returned.
         */
        Path& Load(const PathInput& path);

        /**
         * This method appends the given path to this one,
         * without doubling or losing a slash where they meet.
         *
         * @param[in] path
         *     This is the path to append.
         *
         * @return
         *     The path is returned.
         */
        Path& Add(const PathInput& path);

        /**
         * This method replaces the path with the given one.
         * It's the same as Load.
         *
         * @param[in] path
         *     This is the path to adopt.
         *
         * @return
         *     The path is returned.
         */
        Path& Set(const PathInput& path);

        /**
         * This method removes the given segments from the end
         * of the path, if they match the end of the path exactly.
         * A path of "" (or [""]) removes a trailing slash.
         *
         * @param[in] path
         *     These are the segments to remove.
         *
         * @return
         *     The path is returned.
         */
        Path& Remove(const PathInput& path);

        /**
         * This method removes the whole path.
         *
         * @return
         *     The path is returned.
         */
        Path& Clear();

        /**
         * This method applies and removes "." and ".." segments,
         * and collapses redundant slashes, keeping a trailing slash
         * if there was one.  For example "//a/./b/../c//" becomes "/a/c/".
         *
         * @return
         *     The path is returned.
         */
        Path& Normalize();

        /**
         * This method returns the decoded segments of the path.
         *
         * @return
         *     The segments of the path are returned.
         */
        std::vector< std::string > GetSegments() const;

        /**
         * This method returns an indication of whether or not
         * the path starts with a '/'.
         *
         * @return
         *     An indication of whether or not the path
         *     is absolute is returned.
         */
        bool IsAbsolute() const;

        /**
         * This method sets whether or not the path starts with a '/'.
         *
         * @param[in] isAbsolute
         *     This indicates whether or not the path should be absolute.
         *
         * @throws ImmutableStateError
         *     This is thrown if the owner of the path forces it
         *     to be absolute and the path has segments.
         */
        void SetAbsolute(bool isAbsolute);

        /**
         * This method returns an indication of whether or not
         * the path ends on a directory (is empty or ends with a '/').
         *
         * @return
         *     An indication of whether or not the path ends
         *     on a directory is returned.
         */
        bool IsDirectory() const;

        /**
         * This method returns an indication of whether or not
         * the path ends on a file.
         *
         * @return
         *     An indication of whether or not the path ends
         *     on a file is returned.
         */
        bool IsFile() const;

        /**
         * This method returns an indication of whether or not
         * the path has no segments.
         *
         * @return
         *     An indication of whether or not the path has
         *     no segments is returned.
         */
        bool IsEmpty() const;

        /**
         * This method sets whether or not to warn about path strings
         * that are not correctly percent-encoded.
         *
         * @param[in] strict
         *     This indicates whether or not to warn about path strings
         *     that are not correctly percent-encoded.
         */
        void SetStrict(bool strict);

        /**
         * This method returns whether or not the path warns about
         * path strings that are not correctly percent-encoded.
         *
         * @return
         *     An indication of whether or not the path is
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
         * This method renders the path as a string, with each
         * segment percent-encoded.
         *
         * @return
         *     The path string is returned.
         */
        std::string GenerateString() const;

        // Private methods
    private:
        friend class Url;

        /**
         * This method sets how the owner of the path controls
         * whether or not the path is absolute.
         *
         * @param[in] absoluteness
         *     This is how absoluteness is controlled.
         */
        void SetAbsoluteness(Absoluteness absoluteness);

        /**
         * This method returns how the owner of the path controls
         * whether or not the path is absolute.
         *
         * @return
         *     How absoluteness is controlled is returned.
         */
        Absoluteness GetAbsoluteness() const;

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

#endif /* URL_PATH_HPP */
