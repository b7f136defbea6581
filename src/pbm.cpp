//  pbm.cpp -- portable bitmap images
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cctype>
#include <limits>
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include <insatsu/format.hpp>

#include "pbm.hpp"

namespace insatsu {

using std::runtime_error;

pbm::pbm (std::istream& is)
  : width_(0), height_(0)
{
  char magic[2] = { 0, 0 };

  is.read (magic, sizeof (magic));
  if (!is || 'P' != magic[0] || '4' != magic[1])
    BOOST_THROW_EXCEPTION
      (runtime_error ("'pbm' can only read binary bitmaps (P4)"));

  width_  = header_value_(is);
  height_ = header_value_(is);

  // exactly one whitespace character separates header and pixels
  if (!std::isspace (is.get ()))
    BOOST_THROW_EXCEPTION (runtime_error ("'pbm' header is malformed"));

  pixels_.resize (bitmap ().size ());
  if (!pixels_.empty ())
    is.read (&pixels_[0], pixels_.size ());

  if (is.gcount () != streamsize (pixels_.size ()))
    BOOST_THROW_EXCEPTION
      (runtime_error ((format ("'pbm' image data truncated after %1%"
                               " of %2% bytes")
                       % is.gcount ()
                       % pixels_.size ()).str ()));
}

_drv_::escpos::bitmap
pbm::bitmap () const
{
  return _drv_::escpos::bitmap (pixels_.empty () ? 0 : &pixels_[0],
                                width_, height_);
}

//  Header values are separated by whitespace and may be preceded by
//  comments that run from a '#' to the end of the line.
unsigned
pbm::header_value_(std::istream& is)
{
  for (;;)
    {
      int c = is.peek ();

      /**/ if ('#' == c)
        is.ignore (std::numeric_limits< std::streamsize >::max (), '\n');
      else if (std::isspace (c))
        is.get ();
      else
        break;
    }

  unsigned value = 0;
  if (!(is >> value) || 0 == value)
    BOOST_THROW_EXCEPTION (runtime_error ("'pbm' header is malformed"));

  return value;
}

} // namespace insatsu
