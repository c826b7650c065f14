#include "codec/codec_registry.hpp"
#include "core/config.hpp"
#include "core/log.hpp"
#include <iostream>
#include <sstream>
#include <string>

// Lists the codecs this build can use and the library versions behind them.
int main(int argc, char** argv) {
    using namespace rdc;
    const auto& settings = config::current();
    config::apply_logging(settings);

    bool json = false;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a == "--json") { json = true; continue; }
        if(a == "--help" || a == "-h") {
            std::cout << "Usage: rdc_codec_info [--json]\n";
            return 0;
        }
        std::cerr << "Unknown argument: " << a << "\n";
        std::cout << "Usage: rdc_codec_info [--json]\n";
        return 1;
    }

    log::debug("codec_info: probing codecs");
    const auto codecs = codec::available_codecs(settings);
    const auto versions = codec::codec_versions();

    if(json){
        std::ostringstream oss;
        oss << "{\"codecs\":[";
        for(size_t i=0;i<codecs.size();++i){
            const auto& c = codecs[i];
            oss << '{'
                << "\"name\":\"" << c.name << "\","
                << "\"description\":\"" << c.description << "\","
                << "\"available\":" << (c.available ? "true" : "false") << ','
                << "\"detail\":\"" << c.detail << "\"}";
            if(i+1 < codecs.size()) oss << ',';
        }
        oss << "],\"versions\":{";
        bool first = true;
        for(const auto& [lib, ver] : versions){
            if(!first) oss << ',';
            first = false;
            oss << '"' << lib << "\":\"" << ver << '"';
        }
        oss << "}}";
        std::cout << oss.str() << std::endl;
    } else {
        std::cout << "Codecs:\n";
        for(const auto& c : codecs) {
            std::cout << "  " << c.name << ": " << (c.available ? "yes" : "no")
                      << " (" << c.description << ", " << c.detail << ")\n";
        }
        std::cout << "Versions:\n";
        for(const auto& [lib, ver] : versions) {
            std::cout << "  " << lib << ": " << ver << "\n";
        }
    }

    for(const auto& c : codecs) {
        if(!c.available) return 2;
    }
    return 0;
}
