// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__SENTENCE_SPLITTER__HPP__
#define __ROUGE__SENTENCE_SPLITTER__HPP__ 1

#include <string>
#include <vector>

namespace rouge
{
  // ROUGE-1.5.5 readText sentence splitting
  class SentenceSplitter
  {
  public:
    typedef std::string text_type;
    typedef std::vector<text_type, std::allocator<text_type> > text_set_type;

    enum mode_type {
      NONE,    // whole text
      SPL,     // one sentence per line
      SEE,     // anchors of SEE html
      ISI,     // not implemented
      SIMPLE,  // not implemented
    };

  public:
    explicit SentenceSplitter(const mode_type __mode);
    explicit SentenceSplitter(const std::string& name);

  public:
    void operator()(const text_type& text, text_set_type& sentences) const;

    mode_type mode() const { return __mode; }

    static mode_type parse(const std::string& name);

  private:
    void verify() const;

  private:
    mode_type __mode;
  };
};

#endif
