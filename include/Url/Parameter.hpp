#ifndef URL_PARAMETER_HPP
#define URL_PARAMETER_HPP

/**
 * @file Parameter.hpp
 *
 * This module declares the Url::Parameter class template.
 *
 * © 2018 by Richard Walters
 */

namespace Url {

    /**
     * This holds one optional argument of a multi-parameter mutator,
     * such as Url::Set.  A parameter is either omitted (the default)
     * or present with a value.  A present parameter is distinct from
     * an omitted one even if its value is empty.
     *
     * @note
     *     Assigning a value to an omitted parameter makes it present.
     */
    template< typename T > class Parameter {
        // Public methods
    public:
        /**
         * This constructs an omitted parameter.
         */
        Parameter()
            : present_(false)
            , value_()
        {
        }

        /**
         * This constructs a present parameter holding the given value.
         *
         * @param[in] value
         *     This is the value of the parameter.
         */
        Parameter(const T& value)
            : present_(true)
            , value_(value)
        {
        }

        /**
         * This makes the parameter present, holding the given value.
         *
         * @param[in] value
         *     This is the value to give the parameter.
         *
         * @return
         *     The parameter is returned.
         */
        Parameter& operator=(const T& value) {
            present_ = true;
            value_ = value;
            return *this;
        }

        /**
         * This method returns an indication of whether or not
         * the parameter was given.
         *
         * @return
         *     An indication of whether or not the parameter
         *     was given is returned.
         */
        bool IsPresent() const {
            return present_;
        }

        /**
         * This method returns the value of the parameter.
         *
         * @note
         *     The value is only meaningful if IsPresent returns true.
         *
         * @return
         *     The value of the parameter is returned.
         */
        const T& Get() const {
            return value_;
        }

        /**
         * This method returns the parameter to the omitted state.
         */
        void Omit() {
            present_ = false;
            value_ = T();
        }

        // Private properties
    private:
        /**
         * This indicates whether or not the parameter was given.
         */
        bool present_;

        /**
         * This is the value of the parameter, if it was given.
         */
        T value_;
    };

}

#endif /* URL_PARAMETER_HPP */
