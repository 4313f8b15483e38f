/*
Block Callback - sync calls, async calls and blocks that run back on the caller

The inventory actor owns the stock table. The main thread fills it with async
calls, then walks it with a sync call whose block runs on the main thread
once per item.

Usage:
    cmake -S . -B build && cmake --build build
    ./build/block_callback

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech
*/

#include <any>
#include <cstring>
#include <iostream>
#include <map>
#include <string>
#include "conduct/Actor.hpp"
#include "conduct/ActorRef.hpp"
#include "conduct/Errors.hpp"
#include "conduct/act/Manager.hpp"

using namespace conduct;
using namespace std;

/**
 * InventoryActor - item name to quantity
 */
class InventoryActor : public Actor {
    map<string, int> stock_;

public:
    InventoryActor() {
        strncpy(name, "inventory", sizeof(name));
        CONDUCT_OPERATION(add, 2);
        CONDUCT_OPERATION(count, 0, 1);
        CONDUCT_OPERATION(each, 0);
    }

    any add(const Args& args, const Block&) {
        stock_[any_cast<string>(args[0])] += any_cast<int>(args[1]);
        return stock_.size();
    }

    any count(const Args& args, const Block&) {
        if (args.empty()) {
            int total = 0;
            for (auto& [item, qty] : stock_)
                total += qty;
            return total;
        }
        auto it = stock_.find(any_cast<string>(args[0]));
        return it == stock_.end() ? 0 : it->second;
    }

    // Sums whatever the block returns for each item
    any each(const Args&, const Block& block) {
        double sum = 0;
        for (auto& [item, qty] : stock_)
            sum += any_cast<double>(block({item, qty}));
        return sum;
    }
};

class InventoryManager : public Manager {
public:
    InventoryManager() {
        manage(new InventoryActor());
    }
};

int main() {
    InventoryManager mgr;
    mgr.init();

    ActorRef inventory = mgr.get_actor_by_name("inventory");

    inventory.async("add", {string("bolts"), 120});
    inventory.async("add", {string("nuts"), 300});
    inventory.async("add", {string("washers"), 75});
    inventory.async("add", {string("nuts"), 20});

    cout << "units in stock: " << any_cast<int>(inventory.call("count")) << endl;
    cout << "nuts: " << any_cast<int>(inventory.call("count", {string("nuts")})) << endl;

    map<string, double> prices = {{"bolts", 0.25}, {"nuts", 0.05}, {"washers", 0.02}};
    any value = inventory.call("each", {}, [&prices](const Args& args) -> any {
        auto item = any_cast<string>(args[0]);
        auto qty = any_cast<int>(args[1]);
        cout << "  " << item << " x " << qty << " @ " << prices[item] << endl;
        return qty * prices[item];
    });
    cout << "stock value: " << any_cast<double>(value) << endl;

    try {
        inventory.call("remove", {string("bolts")});
    } catch (const MethodMissingError& e) {
        cerr << "remove failed: " << e.what() << endl;
    }

    try {
        inventory.call("add", {string("bolts")});
    } catch (const ArgumentCountError& e) {
        cerr << "add failed: " << e.what() << endl;
    }

    mgr.shutdown();
    mgr.end();
    return 0;
}
