//  text-encoder.cpp -- character set conversion of text payloads
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

#include <iconv.h>

#include <cerrno>
#include <cstring>

#include <boost/throw_exception.hpp>

#include <insatsu/log.hpp>

#include "exception.hpp"
#include "text-encoder.hpp"

namespace insatsu {
namespace _drv_ {
namespace escpos {

namespace {

//! Owns an iconv conversion descriptor
class converter
{
public:
  converter (const std::string& to, const std::string& from)
    : cd_(iconv_open (to.c_str (), from.c_str ()))
  {
    if (iconv_t (-1) == cd_)
      {
        std::string msg (strerror (errno));
        log::error ("iconv_open (%1%, %2%): %3%") % to % from % msg;
        BOOST_THROW_EXCEPTION
          (invalid_argument ("unsupported code set: '" + to + "'"));
      }
  }

  ~converter ()
  {
    iconv_close (cd_);
  }

  iconv_t get () const { return cd_; }

  void reset () const
  {
    iconv (cd_, 0, 0, 0, 0);
  }

private:
  converter (const converter&);
  converter& operator= (const converter&);

  iconv_t cd_;
};

//  Length of the UTF-8 sequence that starts with \a lead, guarding
//  against sequences running past the end of the input.
size_t
sequence_length (unsigned char lead, size_t left)
{
  size_t n = 1;

  /**/ if (0xf0 == (0xf8 & lead)) n = 4;
  else if (0xe0 == (0xf0 & lead)) n = 3;
  else if (0xc0 == (0xe0 & lead)) n = 2;

  return (n < left ? n : left);
}

}       // namespace

text_encoder::text_encoder (const std::string& code_set, policy p,
                            byte replacement)
  : code_set_(code_set), policy_(p), replacement_(replacement)
{}

const std::string&
text_encoder::code_set () const
{
  return code_set_;
}

text_encoder::policy
text_encoder::invalid_policy () const
{
  return policy_;
}

byte_buffer
text_encoder::operator() (const std::string& utf8) const
{
  converter cnv (code_set_, "UTF-8");

  byte_buffer rv;
  rv.reserve (utf8.size ());

  std::string in (utf8);
  char *inbuf = const_cast< char * > (in.data ());
  size_t inleft = in.size ();

  char chunk[256];

  while (0 < inleft)
    {
      char *outbuf = chunk;
      size_t outleft = sizeof (chunk);

      errno = 0;
      size_t n = iconv (cnv.get (), &inbuf, &inleft, &outbuf, &outleft);
      int err = errno;

      rv.append (chunk, outbuf - chunk);

      if (size_t (-1) != n) continue;
      if (E2BIG == err) continue;

      if (EILSEQ != err && EINVAL != err)
        {
          log::error ("iconv: %1%") % strerror (err);
          BOOST_THROW_EXCEPTION
            (runtime_error (std::string ("iconv: ") + strerror (err)));
        }

      size_t skip = sequence_length (*inbuf, inleft);

      if (STRICT == policy_)
        BOOST_THROW_EXCEPTION
          (invalid_argument ("text not representable in " + code_set_));

      log::debug (log::ESCPOS_DRIVER, "%1%: skipping %2% octet(s) of input")
        % code_set_
        % skip;

      if (REPLACE == policy_)
        rv << replacement_;

      inbuf  += skip;
      inleft -= skip;
      cnv.reset ();
    }

  // flush any pending shift state
  char *outbuf = chunk;
  size_t outleft = sizeof (chunk);
  iconv (cnv.get (), 0, 0, &outbuf, &outleft);
  rv.append (chunk, outbuf - chunk);

  return rv;
}

} // namespace escpos
} // namespace _drv_
} // namespace insatsu
