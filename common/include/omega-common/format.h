#include "utils.h"
#include <array>
#include <cstdint>
#include <memory>

#ifndef OMEGA_COMMON_FORMAT_H
#define OMEGA_COMMON_FORMAT_H

namespace OmegaCommon {

    template<typename T,typename = void>
    struct FormatProvider;

    struct ObjectFormatProviderBase {
        virtual void insertFormattedObject(std::ostream & os) = 0;
        virtual ~ObjectFormatProviderBase() = default;
    };

    /// Holds its own copy of the argument so the provider outlives the call that built it.
    template<class T,class Pr = FormatProvider<T>>
    struct ObjectFormatProvider : public ObjectFormatProviderBase {
        T object;
        void insertFormattedObject(std::ostream &os) override {
            Pr::format(os,object);
        };

        explicit ObjectFormatProvider(T object):object(std::move(object)){

        };
        ~ObjectFormatProvider() override = default;
    };

    template<typename T>
    struct FormatProvider<T,std::enable_if_t<std::is_arithmetic_v<T>>> {
        static void format(std::ostream & os,const T & object){
            if constexpr(std::is_same_v<T,bool>){
                os << (object ? "true" : "false");
            }
            else {
                os << object;
            }
        }
    };

    template<>
    struct FormatProvider<std::string> {
        static void format(std::ostream & os,const std::string & object){
            os << object;
        }
    };

    template<>
    struct FormatProvider<const char *> {
        static void format(std::ostream & os,const char * object){
            os << (object == nullptr ? "(null)" : object);
        }
    };

    template<typename T>
    struct FormatProvider<std::shared_ptr<T>>{
        static void format(std::ostream & os,const std::shared_ptr<T> & object){
            os << "SharedHandle(0x" << std::hex << object.get() << std::dec << ")";
        }
    };

    /// Fallback for classes declared with OMEGACOMMON_CLASS.
    template<typename T>
    struct FormatProvider<T,std::enable_if_t<std::is_array_v<decltype(T::OMEGACOMMON_CLASS_ID)>>> {
        static void format(std::ostream & os,const T & object){
            (void)object;
            os << "<" << T::OMEGACOMMON_CLASS_ID << ">";
        }
    };

    class Formatter;

    OMEGACOMMON_EXPORT Formatter *createFormatter(const char *fmt, std::ostream & out);
    OMEGACOMMON_EXPORT void format(Formatter * formatter,ArrayRef<ObjectFormatProviderBase *> objectFormatProviders);
    OMEGACOMMON_EXPORT void freeFormatter(Formatter *formatter);

    template<typename T>
    ObjectFormatProviderBase * buildFormatProvider(T && object){
        using Stored = std::decay_t<T>;
        return new ObjectFormatProvider<Stored>(std::forward<T>(object));
    };

    /// @brief Formats a string, replacing `@{N}` with the N-th argument.
    template<class ..._Args>
    OmegaCommon::String fmtString(const char *fmt,_Args && ...args){
        std::ostringstream out;
        std::array<ObjectFormatProviderBase *,sizeof...(args)> arrayArgs = {buildFormatProvider(std::forward<_Args>(args))...};
        Formatter * formatter = createFormatter(fmt,out);
        format(formatter,{arrayArgs.data(),arrayArgs.data() + arrayArgs.size()});
        freeFormatter(formatter);
        for(auto a : arrayArgs){
            delete a;
        }

        return out.str();
    };

    template<class ..._Args>
    void LogV(const char *fmt,_Args && ...args){
        std::cout << "[" << "LOG" << "] " << fmtString(fmt,std::forward<_Args>(args)...) << std::endl;
    }

};

#endif
