#ifndef utility_hpp
#define utility_hpp

namespace equiv::detail {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}

#endif /* utility_hpp */
