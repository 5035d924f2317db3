//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "tokenizer.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv)
{
  if (argc < 2) {
    std::cout << argv[0] << " tokenizer-spec" << std::endl;
    std::cout << rouge::Tokenizer::lists();
    return 1;
  }

  try {
    rouge::Tokenizer::tokenizer_ptr_type tokenizer(rouge::Tokenizer::create(argv[1]));

    std::string line;
    rouge::document_type tokenized;
    while (std::getline(std::cin, line)) {
      std::cout << "original: " << line << std::endl;

      (*tokenizer)(line, tokenized);

      for (rouge::document_type::const_iterator diter = tokenized.begin(); diter != tokenized.end(); ++ diter) {
	std::cout << "tokenized:";
	for (rouge::sentence_type::const_iterator siter = diter->begin(); siter != diter->end(); ++ siter)
	  std::cout << ' ' << *siter;
	std::cout << std::endl;
      }
    }
  }
  catch (const std::exception& err) {
    std::cerr << "error: " << err.what() << std::endl;
    return 1;
  }
}
