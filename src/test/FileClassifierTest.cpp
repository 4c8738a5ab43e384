#include <cassert>
#include <iostream>

#include "application/FileClassifier.hpp"
#include "infrastructure/ZipPackage.hpp"
#include "TestSupport.hpp"

using symbolgate::application::FileClassifier;
using symbolgate::infrastructure::ZipPackage;
using symbolgate::test::MakeNuspec;
using symbolgate::test::ZipBuilder;

static void testPredicates() {
    std::cout << "[Test] Extension and satellite predicates..." << std::endl;

    assert(FileClassifier::IsBinaryModule("lib\\net6.0\\A.dll"));
    assert(FileClassifier::IsBinaryModule("tools\\Run.EXE"));
    assert(FileClassifier::IsBinaryModule("runtimes\\win10\\lib\\uap10.0\\X.WinMD"));
    assert(!FileClassifier::IsBinaryModule("lib\\net6.0\\A.pdb"));
    assert(!FileClassifier::IsBinaryModule("lib\\net6.0\\A.dll.config"));
    assert(!FileClassifier::IsBinaryModule("lib\\dll"));

    assert(FileClassifier::IsSatelliteAssembly("lib\\net6.0\\de\\A.resources.dll"));
    assert(FileClassifier::IsSatelliteAssembly("lib\\net6.0\\zh-Hant\\A.resources.dll"));
    // Other casings are ordinary binaries
    assert(!FileClassifier::IsSatelliteAssembly("lib\\net6.0\\zh-Hant\\A.Resources.DLL"));
    assert(!FileClassifier::IsSatelliteAssembly("lib\\net6.0\\fr\\A.RESOURCES.dll"));
    assert(!FileClassifier::IsSatelliteAssembly("lib\\A.resources.dll"));
    assert(!FileClassifier::IsSatelliteAssembly("lib\\net6.0\\de\\A.dll"));

    assert(FileClassifier::LowerExtension("a\\b.C.PDB") == ".pdb");
    assert(FileClassifier::LowerExtension("a.b\\noext").empty());

    std::cout << "[PASS] Predicates." << std::endl;
}

static void testClassifyPackage() {
    std::cout << "[Test] Classifying a multi-target package..." << std::endl;

    std::string zip = ZipBuilder()
        .add("Contoso.Lib.nuspec", MakeNuspec("Contoso.Lib", "1.0.0"))
        .add("lib/net6.0/Contoso.Lib.dll", "MODULE-A")
        .add("lib/net6.0/Contoso.Lib.pdb", "PDB-A")
        .add("lib/net6.0/Contoso.Lib.xml", "<doc/>")
        .add("lib/net6.0/de/Contoso.Lib.resources.dll", "SATELLITE")
        .add("lib/net6.0/fr/Contoso.Lib.Resources.DLL", "MIXED-CASE")
        .add("lib/net6.0/readme.txt", "hello")
        .add("runtimes/win-x64/native/Native.DLL", "MODULE-N")
        .add("runtimes/win10/lib/uap10.0/Contoso.Winrt.winmd", "MODULE-W")
        .add("content/Embedded.dll", "NOT-SCANNED")
        .add("tools/Setup.exe", "NOT-SCANNED")
        .build();

    auto package = ZipPackage::FromBuffer(zip);
    auto classification = FileClassifier::Classify(*package->rootFolder());

    assert(classification.candidates.size() == 4);
    assert(classification.candidates[0].primary->path() == "lib\\net6.0\\Contoso.Lib.dll");
    assert(classification.candidates[0].pdb);
    assert(classification.candidates[0].pdb->path() == "lib\\net6.0\\Contoso.Lib.pdb");
    assert(classification.candidates[1].primary->path() == "lib\\net6.0\\fr\\Contoso.Lib.Resources.DLL");
    assert(!classification.candidates[1].pdb);
    assert(classification.candidates[2].primary->path() == "runtimes\\win-x64\\native\\Native.DLL");
    assert(!classification.candidates[2].pdb);
    assert(classification.candidates[3].primary->path() == "runtimes\\win10\\lib\\uap10.0\\Contoso.Winrt.winmd");

    assert(classification.satellites.size() == 1);
    assert(classification.satellites[0]->path() == "lib\\net6.0\\de\\Contoso.Lib.resources.dll");

    std::cout << "[PASS] Candidates and satellites separated." << std::endl;
}

static void testMissingFolders() {
    std::cout << "[Test] Package without lib or runtimes..." << std::endl;

    std::string zip = ZipBuilder()
        .add("Contoso.Tools.nuspec", MakeNuspec("Contoso.Tools", "2.0.0"))
        .add("tools/net6.0/any/Contoso.Tools.dll", "MODULE")
        .build();

    auto package = ZipPackage::FromBuffer(zip);
    auto classification = FileClassifier::Classify(*package->rootFolder());
    assert(classification.candidates.empty());
    assert(classification.satellites.empty());

    std::cout << "[PASS] Nothing classified." << std::endl;
}

static void testFolderNameCase() {
    std::cout << "[Test] Folder lookup ignores case..." << std::endl;

    std::string zip = ZipBuilder()
        .add("Lib/netstandard2.0/Upper.dll", "MODULE-U")
        .add("Lib/netstandard2.0/Upper.PDB", "PDB-U")
        .build();

    auto package = ZipPackage::FromBuffer(zip);
    auto classification = FileClassifier::Classify(*package->rootFolder());
    assert(classification.candidates.size() == 1);
    assert(classification.candidates[0].pdb);
    assert(classification.candidates[0].pdb->path() == "Lib\\netstandard2.0\\Upper.PDB");

    std::cout << "[PASS] Mixed-case folders and extensions." << std::endl;
}

int main() {
    std::cout << "[Test] Starting FileClassifier Test..." << std::endl;
    testPredicates();
    testClassifyPackage();
    testMissingFolders();
    testFolderNameCase();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
