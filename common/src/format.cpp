#include "omega-common/format.h"
#include <cctype>
#include <iostream>

namespace OmegaCommon {

    class Formatter {
        String fmt;
        std::ostream & out;
    public:
        Formatter(const char *fmt, std::ostream & out): fmt(fmt == nullptr ? "" : fmt), out(out){};
        void format(ArrayRef<ObjectFormatProviderBase *> & objectFormatProviders){
            std::size_t idx = 0;
            const std::size_t len = fmt.size();
            while(idx < len){
                char c = fmt[idx];
                if(c != '@' || idx + 1 >= len || fmt[idx + 1] != '{'){
                    out << c;
                    ++idx;
                    continue;
                }

                /// Parse `@{digits}`; anything malformed is written through verbatim.
                std::size_t cursor = idx + 2;
                unsigned val = 0;
                bool hasDigits = false;
                while(cursor < len && std::isdigit(static_cast<unsigned char>(fmt[cursor]))){
                    val = (val * 10) + unsigned(fmt[cursor] - '0');
                    hasDigits = true;
                    ++cursor;
                }
                if(!hasDigits || cursor >= len || fmt[cursor] != '}'){
                    out << fmt.substr(idx,cursor - idx);
                    idx = cursor;
                    continue;
                }

                if(val < objectFormatProviders.size()){
                    objectFormatProviders[val]->insertFormattedObject(out);
                }
                else {
                    out << "@{" << val << "}";
                }
                idx = cursor + 1;
            }
        }
        ~Formatter()= default;
    };

    Formatter *createFormatter(const char *fmt, std::ostream & out){
        return new Formatter(fmt,out);
    };

    void format(Formatter * formatter,ArrayRef<ObjectFormatProviderBase *> objectFormatProviders){
        formatter->format(objectFormatProviders);
    };

    void freeFormatter(Formatter *formatter){
        delete formatter;
    };

}
