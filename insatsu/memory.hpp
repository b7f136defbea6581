//  memory.hpp -- managed memory pointers
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

#ifndef insatsu_memory_hpp_
#define insatsu_memory_hpp_

/*! \file
 *  \brief Inject standard compliant managed memory pointers
 *
 *  We would like to use \c shared_ptr as if it were part of the \c
 *  insatsu namespace and not worry about whether we are using the \c
 *  std:: or \c boost:: version.  This header file lets us.
 */

#if __cplusplus >= 201103L

#include <memory>
#define NAMESPACE std

#else   /* emulate C++11 */

#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#define NAMESPACE boost

#endif

namespace insatsu {

using NAMESPACE::dynamic_pointer_cast;
using NAMESPACE::make_shared;
using NAMESPACE::shared_ptr;

/*! Sometimes API requirements dictate the use of a \c shared_ptr<T>.
 *  Naively converting a raw pointer to a shared one will result in
 *  deletion of that raw pointer when the shared pointer goes out of
 *  scope.  To prevent this from happening, just pass a null_deleter
 *  with the raw pointer to the \c shared_ptr<T> constructor.
 */
struct null_deleter
{
  void operator() (const void *) const {}
};

}       // namespace insatsu

#undef NAMESPACE

#endif  /* insatsu_memory_hpp_ */
