//  functional.hpp -- function objects and binders
//  Copyright (C) 2012, 2013  SEIKO EPSON CORPORATION
//  Copyright (C) 2026  Insatsu contributors
//
//  License: GPL-3.0+
//
//  This file is part of the 'Insatsu' package.
//  This package is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License or, at
//  your option, any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//  You ought to have received a copy of the GNU General Public License
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.

#ifndef insatsu_functional_hpp_
#define insatsu_functional_hpp_

/*! \file
 *  \brief Inject standard compliant function wrappers
 *
 *  Lets us use \c function and \c bind as if they were part of the
 *  \c insatsu namespace, whether they come from the standard library
 *  or from Boost.
 */

#if __cplusplus >= 201103L

#include <functional>
#define NAMESPACE std

#else   /* emulate C++11 */

#include <boost/bind.hpp>
#include <boost/function.hpp>
#include <boost/ref.hpp>
#define NAMESPACE boost

#endif

namespace insatsu {

using NAMESPACE::bind;
using NAMESPACE::function;
using NAMESPACE::ref;

#if __cplusplus >= 201103L
namespace placeholders = std::placeholders;
#else
namespace placeholders {
  using ::_1;
}
#endif

}       // namespace insatsu

#undef NAMESPACE

#endif  /* insatsu_functional_hpp_ */
