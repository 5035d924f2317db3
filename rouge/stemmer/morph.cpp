//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "stemmer/morph.hpp"

#include "error.hpp"

#include <vector>
#include <algorithm>
#include <sstream>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/lexical_cast.hpp>

namespace rouge
{
  namespace stemmer
  {
    Morph::path_type Morph::exception_path(const path_type& data)
    {
      return data / "WordNet-2.0-Exceptions";
    }

    Morph::Morph(const path_type& path)
    {
      typedef std::vector<path_type, std::allocator<path_type> > path_set_type;

      if (! boost::filesystem::is_directory(path))
	throw config_error("no WordNet exception directory: " + path.string());

      path_set_type files;
      boost::filesystem::directory_iterator iter_end;
      for (boost::filesystem::directory_iterator iter(path); iter != iter_end; ++ iter)
	if (boost::filesystem::is_regular_file(iter->status()) && iter->path().extension() == ".exc")
	  files.push_back(iter->path());

      if (files.size() != 4)
	throw config_error("exception files needed: adj.exc, adv.exc, noun.exc, verb.exc, found "
			   + boost::lexical_cast<std::string>(files.size()) + " in " + path.string());

      // adj, adv, noun, verb: later files override earlier entries
      std::sort(files.begin(), files.end());

      for (path_set_type::const_iterator fiter = files.begin(); fiter != files.end(); ++ fiter) {
	boost::filesystem::ifstream is(*fiter);
	if (! is)
	  throw config_error("cannot read exception file: " + fiter->string());

	std::string inflected;
	std::string base;
	std::string line;
	while (std::getline(is, line)) {
	  std::istringstream tokens(line);
	  if (tokens >> inflected >> base)
	    exceptions[inflected] = base;
	}
      }
    }

    Morph::word_type Morph::stem(const word_type& word) const
    {
      exception_map_type::const_iterator iter = exceptions.find(word);

      return porter(iter != exceptions.end() ? iter->second : word);
    }
  };
};
