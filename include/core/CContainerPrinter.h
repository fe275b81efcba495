/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License
 * 2.0 and the following additional limitation. Functionality enabled by the
 * files subject to the Elastic License 2.0 may only be used in production when
 * invoked by an Elasticsearch process with a license key installed that permits
 * use of machine learning features. You may not use this file except in
 * compliance with the Elastic License 2.0 and the foregoing additional
 * limitation.
 */
#ifndef INCLUDED_xp_core_CContainerPrinter_h
#define INCLUDED_xp_core_CContainerPrinter_h

#include <core/CNonInstantiatable.h>
#include <core/ImportExport.h>

#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace xp {
namespace core {
namespace printer_detail {

//! \name Check for nested typedef "const_iterator".
//@{
template<typename, typename = void>
struct has_const_iterator : std::false_type {};
template<typename T>
struct has_const_iterator<T, std::void_t<typename T::const_iterator>> : std::true_type {};
//@}

//! \name Check for member const function print.
//@{
template<typename, typename = void>
struct has_member_print_function : std::false_type {};
// clang-format off
template<typename T>
struct has_member_print_function<
        T, std::enable_if_t<std::is_same_v<decltype(&T::print), std::string (T::*)() const>>
    > : std::true_type {};
// clang-format on
//@}
}

//! \brief Prints STL compliant container objects and iterator ranges.
//!
//! DESCRIPTION:\n
//! This is used to build the diagnostic text of exceptions and log messages,
//! for example the names which are missing from a parameterization:
//! \code{.cpp}
//!   std::set<std::string> missing{"lr", "momentum"};
//!   LOG_DEBUG(<< "Missing " << CContainerPrinter::print(missing));
//! \endcode
//! produces "Missing [lr, momentum]".
//!
//! Elements are printed using their print() member function if they have
//! one, recursively if they're containers, and with std::ostringstream
//! otherwise. Pointers, std::unique_ptr, std::shared_ptr and std::optional
//! are dereferenced.
//!
//! IMPLEMENTATION:\n
//! It doesn't attempt to be high performance and is intended for building
//! error messages and debugging.
class CORE_EXPORT CContainerPrinter : private CNonInstantiatable {
private:
    static const std::string NULL_STR;

    //! Print a container element for debug.
    template<typename T>
    static std::string printElement(const T& value) {
        if constexpr (printer_detail::has_member_print_function<T>::value) {
            return value.print();
        } else if constexpr (printer_detail::has_const_iterator<T>::value) {
            return print(value.begin(), value.end());
        } else {
            std::ostringstream result;
            result << value;
            return result.str();
        }
    }

    //! Print a raw pointer.
    template<typename T>
    static std::string printElement(const T* value) {
        return value == nullptr ? NULL_STR : printElement(*value);
    }

    template<typename T>
    static std::string printElement(T* value) {
        return value == nullptr ? NULL_STR : printElement(*value);
    }

    //! Print a std::unique_ptr.
    template<typename T>
    static std::string printElement(const std::unique_ptr<T>& value) {
        return value == nullptr ? NULL_STR : printElement(*value);
    }

    //! Print a std::shared_pointer.
    template<typename T>
    static std::string printElement(const std::shared_ptr<T>& value) {
        return value == nullptr ? NULL_STR : printElement(*value);
    }

    //! Print an optional.
    template<typename T>
    static std::string printElement(const std::optional<T>& value) {
        return value == std::nullopt ? NULL_STR : printElement(*value);
    }

    //! Print a std::pair.
    template<typename U, typename V>
    static std::string printElement(const std::pair<U, V>& value) {
        return "(" + printElement(value.first) + ", " + printElement(value.second) + ")";
    }

    //! Print a string.
    static const std::string& printElement(const std::string& value) {
        return value;
    }

public:
    //! Fallback print.
    template<typename T>
    static auto print(const T& t) -> decltype(printElement(t)) {
        return printElement(t);
    }

    //! Print a range of values as defined by a start and end iterator.
    template<typename ITR>
    static std::string print(ITR begin, ITR end) {
        std::string result{"["};
        if (begin != end) {
            for (;;) {
                result += printElement(*begin);
                if (++begin == end) {
                    break;
                }
                result += ", ";
            }
        }
        result += "]";
        return result;
    }
};
}
}

#endif // INCLUDED_xp_core_CContainerPrinter_h
