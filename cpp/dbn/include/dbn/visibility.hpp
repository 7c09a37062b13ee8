/** Defines a DBN_PUBLIC visibility attribute macro, which is used on all public interfaces.
 *  This can be defined before including `dbn.hpp` to directly control symbol visibility.
 *  If not defined externally, this library attempts to export symbols from the translation unit
 *  where DBN_IMPLEMENTATION is defined, and import them anywhere else.
 */
#ifndef DBN_PUBLIC
#  if defined _WIN32 || defined __CYGWIN__
#    ifdef __GNUC__
#      define DBN_EXPORT __attribute__((dllexport))
#      define DBN_IMPORT __attribute__((dllimport))
#    else
#      define DBN_EXPORT __declspec(dllexport)
#      define DBN_IMPORT __declspec(dllimport)
#    endif
#    ifdef DBN_IMPLEMENTATION
#      define DBN_PUBLIC DBN_EXPORT
#    else
#      define DBN_PUBLIC DBN_IMPORT
#    endif
#  else
#    define DBN_EXPORT __attribute__((visibility("default")))
#    define DBN_IMPORT
#    if __GNUC__ >= 4
#      define DBN_PUBLIC __attribute__((visibility("default")))
#    else
#      define DBN_PUBLIC
#    endif
#  endif
#endif
