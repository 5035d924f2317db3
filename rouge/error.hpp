// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__ERROR__HPP__
#define __ROUGE__ERROR__HPP__ 1

#include <string>
#include <stdexcept>

namespace rouge
{
  // invalid or missing configuration, raised at construction
  struct config_error : public std::runtime_error
  {
    explicit config_error(const std::string& message) : std::runtime_error(message) {}
  };

  // declared, but not implemented
  struct unimplemented_error : public std::runtime_error
  {
    explicit unimplemented_error(const std::string& message) : std::runtime_error(message) {}
  };
};

#endif
