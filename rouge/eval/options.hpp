// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__EVAL__OPTIONS__HPP__
#define __ROUGE__EVAL__OPTIONS__HPP__ 1

#include <string>

#include <rouge/parameter.hpp>

#include <boost/filesystem/path.hpp>

namespace rouge
{
  namespace eval
  {
    // ROUGE-1.5.5 command line flags
    struct Rouge155Options
    {
      typedef boost::filesystem::path path_type;

      int       b;  // only the first n bytes of the text
      int       l;  // only the first n words of the text
      bool      m;  // stemming
      bool      s;  // stopword removal
      int       n;  // up to ROUGE-n
      char      f;  // A: model average, B: best model
      double    p;  // alpha, relative importance of recall and precision
      path_type e;  // ROUGE data directory
      int       v;  // verbose

      Rouge155Options();

      // rouge:b=0,l=0,m=true,...  flags not implemented (x, c, r, d, w, z, t, a, u, 2, 3) are accepted and ignored
      explicit Rouge155Options(const Parameter& param);
    };
  };
};

#endif
