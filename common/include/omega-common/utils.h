#ifndef __cplusplus
#error OmegaCommon must be compiled as a C++ api
#endif

#include <string>
#include <sstream>
#include <type_traits>
#include <vector>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <cstring>
#include <memory>
#include <optional>
#include <iostream>
#include <algorithm>
#include <cassert>



#ifndef OMEGA_COMMON_COMMON_UTILS_H
#define OMEGA_COMMON_COMMON_UTILS_H

#ifdef _WIN32
#ifdef OMEGACOMMON__BUILD__
#define OMEGACOMMON_EXPORT __declspec(dllexport)
#else
#define OMEGACOMMON_EXPORT __declspec(dllimport)
#endif
#else

#define OMEGACOMMON_EXPORT

#endif

#define OMEGACOMMON_CLASS_ID CLASS_ID

#define OMEGACOMMON_CLASS(id) static constexpr char OMEGACOMMON_CLASS_ID[] = id;


namespace OmegaCommon {

    typedef std::string String;

    template<class T>
    using Vector = std::vector<T>;

    template<class K,class V>
    using Map = std::map<K,V>;

    template<class K,class V>
    using MapVec = std::unordered_map<K,V>;

    template<class T>
    using SetVec = std::unordered_set<T>;

    /**
      An immutable reference to a contiguous range (Vector or C array).
    */
    template<class T>
    class ArrayRef {
        const T *_data;
    public:
        typedef unsigned int size_type;
    private:
        size_type _size;
    public:
        typedef const T * const_iterator;
        typedef const T & const_reference;

        bool empty() const noexcept{
            return _size == 0;
        };

        size_type size() const{
            return _size;
        };

        const_iterator begin() const{
            return _data;
        };
        const_iterator end() const{
            return _data + _size;
        };

        const_reference operator[](size_type idx) const{
            assert(idx < _size && "Index must be smaller than the size of the ArrayRef");
            return _data[idx];
        };

        ArrayRef(const T * beg,const T * end):_data(beg),_size(size_type(end - beg)){

        };

        ArrayRef(const Vector<T> & vec):_data(vec.data()),_size((size_type)vec.size()){

        };

        operator Vector<T>() const{
            return {begin(),end()};
        }
    };

    template<class T>
    ArrayRef<T> makeArrayRef(const T * begin,const T * end){
        return {begin,end};
    }

    typedef enum : int {
        Ok,
        Failed
    } StatusCode;

    template<class T>
    using Optional = std::optional<T>;

    template<class O,class T>
    bool is(std::shared_ptr<T> &object){
        return (dynamic_cast<O *>(object.get()) != nullptr);
    };
};

template<class _Ty>
using SharedHandle = std::shared_ptr<_Ty>;
/**Creates a Shared Instance of _Ty and returns it*/
template<class _Ty,class... _Args>
inline SharedHandle<_Ty> make(_Args && ...args){
    return std::make_shared<_Ty>(std::forward<_Args>(args)...);
};

template<class _Ty>
using UniqueHandle = std::unique_ptr<_Ty>;

/**
 * @brief Creates a SharedHandle type-alias.
 *
 */
#define OMEGACOMMON_SHARED_CLASS(name) typedef SharedHandle<name> name##Ptr
/**
 * @brief Creates a UniqueHandle type-alias.
 *
 */
#define OMEGACOMMON_UNIQUE_CLASS(name) typedef UniqueHandle<name> name##UPtr


#endif
