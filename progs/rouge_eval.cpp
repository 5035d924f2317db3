//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

// ROUGE-N evaluation tool
// candidate and references are whole files, one sentence per line

#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include <cstdlib>

#include "rouge/eval/rouge.hpp"
#include "rouge/tokenizer.hpp"

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

typedef boost::filesystem::path path_type;
typedef std::vector<path_type, std::allocator<path_type> > path_set_type;

typedef rouge::eval::Rouge           rouge_type;
typedef rouge::eval::RougeSession    session_type;
typedef rouge::eval::Rouge155Options options_type;

typedef rouge_type::text_type     text_type;
typedef rouge_type::text_set_type text_set_type;

path_type     candidate_file;
path_set_type reference_files;
path_type     output_file = "-";

std::string tokenizer_spec;

int         byte_limit = 0;
int         word_limit = 0;
bool        stem = false;
bool        stopword = false;
int         order = 4;
std::string formula = "A";
double      alpha = 0.5;
path_type   data_dir;

bool incremental = false;
bool tokenizer_list = false;

int debug = 0;

void read_text(const path_type& path, text_type& text, text_set_type& lines);

void options(int argc, char** argv);

int main(int argc, char** argv)
{
  try {
    options(argc, argv);

    if (tokenizer_list) {
      std::cout << rouge::Tokenizer::lists();
      std::cout << rouge_type::lists();
      return 0;
    }

    if (candidate_file.empty())
      throw std::runtime_error("no candidate file?");
    if (reference_files.empty())
      throw std::runtime_error("no reference files?");
    if (formula != "A" && formula != "B")
      throw std::runtime_error("invalid scoring formula: " + formula);

    rouge_type::rouge_ptr_type scorer;

    if (! tokenizer_spec.empty())
      scorer.reset(new rouge_type(rouge::Tokenizer::create(tokenizer_spec), order, rouge_type::scoring_type(formula[0]), alpha, debug));
    else {
      options_type options;
      options.b = byte_limit;
      options.l = word_limit;
      options.m = stem;
      options.s = stopword;
      options.n = order;
      options.f = formula[0];
      options.p = alpha;
      options.v = debug;
      if (! data_dir.empty())
	options.e = data_dir;

      scorer = rouge_type::from_rouge155(options);
    }

    text_set_type references(reference_files.size());
    text_set_type lines;
    for (size_t i = 0; i != reference_files.size(); ++ i)
      read_text(reference_files[i], references[i], lines);

    text_type     candidate;
    text_set_type candidate_lines;
    read_text(candidate_file, candidate, candidate_lines);

    std::ostream* os = &std::cout;
    boost::filesystem::ofstream ofs;
    if (output_file != "-") {
      ofs.open(output_file);
      if (! ofs)
	throw std::runtime_error("cannot open output: " + output_file.string());
      os = &ofs;
    }

    if (incremental) {
      session_type session = scorer->reset_incremental(references);

      for (size_t i = 0; i != candidate_lines.size(); ++ i) {
	const rouge_type::recall_map_type results = scorer->n_score_incremental(session, candidate_lines[i]);

	for (rouge_type::recall_map_type::const_iterator riter = results.begin(); riter != results.end(); ++ riter) {
	  *os << riter->first << " R: ";
	  if (riter->second)
	    *os << *(riter->second);
	  else
	    *os << "none";
	  *os << '\n';
	}
      }
    } else {
      const rouge_type::score_map_type results = scorer->n_score(references, candidate);

      for (rouge_type::score_map_type::const_iterator riter = results.begin(); riter != results.end(); ++ riter)
	*os << riter->first << ' ' << riter->second << '\n';
    }

    os->flush();
  }
  catch (const std::exception& err) {
    std::cerr << "error: " << err.what() << std::endl;
    return 1;
  }
  return 0;
}

// lines joined by a space, as the regression data of ROUGE-1.5.5
void read_text(const path_type& path, text_type& text, text_set_type& lines)
{
  if (! boost::filesystem::exists(path))
    throw std::runtime_error("no file: " + path.string());

  boost::filesystem::ifstream is(path);
  if (! is)
    throw std::runtime_error("cannot read: " + path.string());

  text.clear();
  lines.clear();

  std::string line;
  while (std::getline(is, line)) {
    if (! text.empty())
      text += ' ';
    text += line;
    lines.push_back(line);
  }

  if (debug >= 2)
    std::cerr << "read: " << path.string() << " lines: " << lines.size() << std::endl;
}

void options(int argc, char** argv)
{
  namespace po = boost::program_options;

  po::options_description opts_config("configuration options");

  opts_config.add_options()
    ("candidate", po::value<path_type>(&candidate_file), "candidate (peer) summary file")
    ("reference", po::value<path_set_type>(&reference_files)->multitoken(), "reference (model) summary file(s)")
    ("output",    po::value<path_type>(&output_file)->default_value(output_file), "output file")

    ("tokenizer", po::value<std::string>(&tokenizer_spec), "tokenizer spec, instead of ROUGE-1.5.5 tokenization")

    ("byte-limit", po::value<int>(&byte_limit)->default_value(byte_limit), "only the first n bytes (-b)")
    ("word-limit", po::value<int>(&word_limit)->default_value(word_limit), "only the first n words (-l)")
    ("stem",       po::bool_switch(&stem),                                  "stemming (-m)")
    ("stopword",   po::bool_switch(&stopword),                              "stopword removal (-s)")
    ("order",      po::value<int>(&order)->default_value(order),            "compute up to ROUGE-n (-n)")
    ("formula",    po::value<std::string>(&formula)->default_value(formula), "scoring formula, A: model average, B: best model (-f)")
    ("alpha",      po::value<double>(&alpha)->default_value(alpha),         "relative importance of recall and precision (-p)")
    ("data",       po::value<path_type>(&data_dir),                         "ROUGE data directory (-e), default $ROUGE_EVAL_HOME")

    ("incremental", po::bool_switch(&incremental), "incremental recall for each line of the candidate")
    ("list",        po::bool_switch(&tokenizer_list), "list of tokenizers and options");

  po::options_description opts_command("command line options");
  opts_command.add_options()
    ("debug", po::value<int>(&debug)->implicit_value(1), "debug level")
    ("help", "help message");

  po::options_description desc_command;
  desc_command.add(opts_config).add(opts_command);

  po::variables_map variables;
  po::store(po::parse_command_line(argc, argv, desc_command, po::command_line_style::unix_style & (~po::command_line_style::allow_guessing)), variables);

  po::notify(variables);

  if (variables.count("help")) {
    std::cout << argv[0] << " [options]" << '\n' << desc_command << '\n';
    exit(0);
  }
}
