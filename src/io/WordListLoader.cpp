#include "WordListLoader.hpp"
#include "../core/GeoWordsConstants.hpp"
#include "../core/GeoWordsError.hpp"
#include "../debug_utils.hpp"
#include "../encoders/text/HumanWordList.hpp"
#include "../encoders/text/WordListBuilder.hpp"
#include <zlib.h>
#include <cctype>
#include <utility>

#ifndef GEOWORDS_DEFAULT_WORDS_DIR
#define GEOWORDS_DEFAULT_WORDS_DIR "words"
#endif

namespace GeoWords {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0, end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

// Closes the zlib handle on every exit path
struct GzFileCloser {
    void operator()(gzFile_s* file) const { gzclose(file); }
};

} // namespace

WordListConfig WordListConfig::fromDirectory(const std::string& directory) {
    std::string dir = directory;
    if (!dir.empty() && dir.back() != '/') dir += '/';
    return {dir + THREE_WORD_LIST_FILE, dir + FOUR_WORD_LIST_FILE};
}

WordListConfig WordListConfig::defaults() {
    return fromDirectory(GEOWORDS_DEFAULT_WORDS_DIR);
}

const WordList& BaseWordLists::forWordCount(size_t wordCount) const {
    switch (wordCount) {
        case 3: return threeWords;
        case 4: return fourWords;
        case 6: return sixWords;
        default:
            throw WordCountMismatchError("No word list for " + std::to_string(wordCount) + " words");
    }
}

std::vector<std::string> WordListLoader::loadWords(const std::string& path) {
    std::unique_ptr<gzFile_s, GzFileCloser> file(gzopen(path.c_str(), "rb"));
    if (!file) {
        throw WordListIOError("Could not open word list: " + path);
    }

    std::vector<std::string> words;
    std::string line;
    size_t skipped = 0;
    auto flushLine = [&]() {
        std::string word = trim(line);
        line.clear();
        if (word.empty()) {
            ++skipped;
            return;
        }
        words.push_back(std::move(word));
    };

    char buf[256];
    while (gzgets(file.get(), buf, sizeof(buf)) != Z_NULL) {
        line += buf;
        // gzgets stops at the buffer size; keep reading until the newline
        if (!line.empty() && line.back() == '\n') flushLine();
    }
    if (!line.empty()) flushLine();

    int errnum = Z_OK;
    const char* message = gzerror(file.get(), &errnum);
    if (errnum != Z_OK && errnum != Z_STREAM_END) {
        throw WordListIOError("Failed to read word list " + path + ": " + message);
    }

    DebugUtils::printMessage("LOAD", "read " + std::to_string(words.size()) + " words from " + path +
                                     (skipped ? " (" + std::to_string(skipped) + " blank lines skipped)" : ""));
    return words;
}

std::shared_ptr<const BaseWordLists> WordListLoader::loadBaseWordLists(const WordListConfig& config) {
    auto lists = std::make_shared<BaseWordLists>();
    lists->threeWords = WordListBuilder::build(loadWords(config.threeWordPath), THREE_WORD_LIST_SIZE);
    lists->fourWords = WordListBuilder::build(loadWords(config.fourWordPath), FOUR_WORD_LIST_SIZE);
    lists->sixWords = WordListBuilder::buildFixed(humanWordList(), SIX_WORD_LIST_SIZE);

    DebugUtils::printWordListInfo(lists->threeWords, "3-word list");
    DebugUtils::printWordListInfo(lists->fourWords, "4-word list");
    DebugUtils::printWordListInfo(lists->sixWords, "6-word list");
    return lists;
}

} // namespace GeoWords
