#include "WordHasher.hpp"
#include "io/WordListLoader.hpp"
#include <iomanip>
#include <iostream>
#include <string>

using namespace GeoWords;

/**
 * Example application demonstrating how to use GeoWords as a library
 */
int main(int argc, char* argv[]) {
    std::cout << "GeoWords Library Example" << std::endl;
    std::cout << "========================" << std::endl;

    try {
        // Word lists are loaded once and shared by every hasher
        const WordListConfig config = argc > 1 ? WordListConfig::fromDirectory(argv[1])
                                               : WordListConfig::defaults();
        auto lists = WordListLoader::loadBaseWordLists(config);

        WordHasher hasher(lists);
        const double lat = -33.867480754852295;
        const double lon = 151.20700120925903;

        // Example 1: the three address variants
        std::cout << "\nExample 1: Encoding (" << lat << ", " << lon << ")" << std::endl;
        std::cout << "3 words: " << hasher.threeWords(lat, lon) << std::endl;
        std::cout << "4 words: " << hasher.fourWords(lat, lon) << std::endl;
        std::cout << "6 words: " << hasher.sixWords(lat, lon) << std::endl;

        // Example 2: decoding back to the cell centre
        std::cout << "\nExample 2: Decoding" << std::endl;
        const std::string address = hasher.threeWords(lat, lon);
        auto coords = hasher.decode(address);
        std::cout << std::setprecision(17);
        std::cout << address << " -> (" << coords.first << ", " << coords.second << ")" << std::endl;

        // Example 3: a keyed hasher gives a private address space
        std::cout << "\nExample 3: Keyed addresses" << std::endl;
        WordHasher keyed(lists, std::string("secret"));
        const std::string secretAddress = keyed.threeWords(lat, lon);
        std::cout << "With key 'secret': " << secretAddress << std::endl;
        coords = keyed.decode(secretAddress);
        std::cout << "Decoded with the same key: (" << coords.first << ", " << coords.second << ")" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
