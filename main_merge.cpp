// ===================== main_merge.cpp =====================
// Merges the per-country files of several relay_scan output directories.
//   ./build/relay_merge --input=run1 --input=run2 --output=merged_results

#include <iostream>
#include <string>
#include <vector>

#include "result_writer.hpp"

using namespace std;
using namespace relay;

static void print_usage(const char *argv0)
{
    cerr << "Usage:\n"
         << "  " << argv0 << " [--input=DIR ...] [--output=DIR]\n"
         << "\nDefaults: --input=ip_results --output=merged_results\n";
}

int main(int argc, char *argv[])
{
    ios::sync_with_stdio(false);

    vector<string> inputs;
    string output = "merged_results";

    for (int i = 1; i < argc; ++i)
    {
        string a = argv[i];
        if (a.rfind("--input=", 0) == 0 && a.size() > 8)
            inputs.push_back(a.substr(8));
        else if (a.rfind("--output=", 0) == 0 && a.size() > 9)
            output = a.substr(9);
        else
        {
            print_usage(argv[0]);
            return 1;
        }
    }
    if (inputs.empty())
        inputs.push_back("ip_results");

    try
    {
        Buckets merged = merge_result_dirs(inputs, output);
        size_t total = 0;
        for (const auto &kv : merged)
        {
            cout << kv.first << ": " << kv.second.size() << " unique IPs\n";
            total += kv.second.size();
        }
        cout << "Merged " << total << " unique IPs from " << inputs.size()
             << " director" << (inputs.size() == 1 ? "y" : "ies") << " into " << output << '\n';
        return 0;
    }
    catch (const exception &e)
    {
        cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
