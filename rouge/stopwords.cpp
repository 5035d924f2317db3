//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "stopwords.hpp"

#include "error.hpp"

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

namespace rouge
{
  Stopwords::path_type Stopwords::stopword_path(const path_type& data)
  {
    return data / "smart_common_words.txt";
  }

  Stopwords::Stopwords(const path_type& path)
  {
    if (! boost::filesystem::is_regular_file(path))
      throw config_error("stopword file " + path.string() + " not found");

    boost::filesystem::ifstream is(path);
    if (! is)
      throw config_error("cannot read stopword file: " + path.string());

    std::string line;
    while (std::getline(is, line)) {
      if (! line.empty() && line[line.size() - 1] == '\r')
	line.erase(line.size() - 1);
      words.insert(line);
    }
  }
};
