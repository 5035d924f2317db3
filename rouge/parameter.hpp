// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__PARAMETER__HPP__
#define __ROUGE__PARAMETER__HPP__ 1

// parameter string of the form name:key=value,key="quoted value"

#include <string>
#include <vector>
#include <iostream>

namespace rouge
{
  class Parameter
  {
  public:
    typedef std::string name_type;
    typedef std::string key_type;
    typedef std::string mapped_type;
    typedef std::pair<key_type, mapped_type> value_type;

  private:
    typedef std::vector<value_type, std::allocator<value_type> > value_set_type;

  public:
    typedef value_set_type::size_type       size_type;
    typedef value_set_type::difference_type difference_type;

    typedef value_set_type::const_iterator const_iterator;
    typedef value_set_type::const_iterator iterator;

  public:
    Parameter() : __name(), __values() {}
    explicit Parameter(const std::string& parameter) : __name(), __values() { parse(parameter); }

    const name_type& name() const { return __name; }

    const_iterator begin() const { return __values.begin(); }
    const_iterator end() const { return __values.end(); }

    bool empty() const { return __values.empty(); }
    size_type size() const { return __values.size(); }

    const_iterator find(const key_type& key) const;

    void push_back(const value_type& x) { __values.push_back(x); }

  public:
    friend
    std::ostream& operator<<(std::ostream& os, const Parameter& x);

  private:
    void parse(const std::string& parameter);

  private:
    name_type      __name;
    value_set_type __values;
  };

  // "true", "yes", "on", "1" and their negations, case-insensitive
  bool parameter_to_bool(const std::string& key, const std::string& value);
  int parameter_to_int(const std::string& key, const std::string& value);
  double parameter_to_double(const std::string& key, const std::string& value);
};

#endif
