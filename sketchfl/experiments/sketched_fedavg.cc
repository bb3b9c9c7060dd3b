#include <iostream>
#include <string>
#include "sketchfl/controller/controller.hh"

using namespace sketchfl::controller;
using namespace std;

int main(int argc, char **argv) {

    if (argc != 2) {
        cerr << "Usage: " << argv[0] << " <config.json>" << endl;
        return -1;
    }

    string cfg = string(argv[1]);

    try {
        Controller controller(cfg);

        controller.InitializeSimulation();
        controller.ShowNetworkInfo();
        controller.TrainOverNetwork();
        controller.ShowNetworkStats();
    } catch (const std::exception &e) {
        cerr << "\n[-]" << e.what() << endl;
        return 1;
    }

    return 0;
}
