#include <cassert>
#include <string>

#include "codec/group_address.hpp"

using knxbridge::codec::GroupAddress;
using knxbridge::codec::format_group_address;
using knxbridge::codec::is_valid_group_address;
using knxbridge::codec::parse_group_address;

int main() {
    {
        GroupAddress ga;
        assert(parse_group_address("1/0/7", ga));
        assert(ga.main == 1 && ga.middle == 0 && ga.sub == 7);
        assert(ga.raw() == 0x0807);
        assert(format_group_address(ga) == "1/0/7");

        assert(parse_group_address("31/7/255", ga));
        assert(ga.raw() == 0xFFFF);
        assert(format_group_address(GroupAddress::from_raw(0xFFFF)) == "31/7/255");

        assert(parse_group_address("9/1/0", ga));
        assert(GroupAddress::from_raw(ga.raw()).raw() == ga.raw());
    }

    {
        assert(is_valid_group_address("0/0/0"));
        assert(!is_valid_group_address(""));
        assert(!is_valid_group_address("1/0"));
        assert(!is_valid_group_address("1/0/7/1"));
        assert(!is_valid_group_address("32/0/0"));
        assert(!is_valid_group_address("1/8/0"));
        assert(!is_valid_group_address("1/0/256"));
        assert(!is_valid_group_address("1//7"));
        assert(!is_valid_group_address("a/0/7"));
        assert(!is_valid_group_address(" 1/0/7"));
        assert(!is_valid_group_address("1/0/-1"));
        assert(!is_valid_group_address("0001/0/7"));
    }

    {
        // A failed parse leaves the output untouched.
        GroupAddress ga;
        ga.main = 3;
        ga.middle = 2;
        ga.sub = 1;
        assert(!parse_group_address("99/0/0", ga));
        assert(ga.main == 3 && ga.middle == 2 && ga.sub == 1);
    }

    return 0;
}
