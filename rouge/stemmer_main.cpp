//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "stemmer.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv)
{
  if (argc < 2) {
    std::cout << argv[0] << " stemmer-spec" << std::endl;
    std::cout << rouge::Stemmer::lists();
    return 1;
  }

  try {
    rouge::Stemmer::stemmer_ptr_type stemmer(rouge::Stemmer::create(argv[1]));

    std::string word;
    while (std::cin >> word)
      std::cout << "word: " << word << " stemmed: " << (*stemmer)(word) << std::endl;
  }
  catch (const std::exception& err) {
    std::cerr << "error: " << err.what() << std::endl;
    return 1;
  }
}
