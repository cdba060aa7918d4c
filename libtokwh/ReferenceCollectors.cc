#include <tokwh/ReferenceCollectors.hh>

#include <tokwh/Cl_Codeblocks.hh>
#include <tokwh/Cl_Footnotes.hh>
#include <tokwh/Cl_Headings.hh>
#include <tokwh/Cl_Html.hh>
#include <tokwh/Cl_Images.hh>
#include <tokwh/Cl_Links.hh>
#include <tokwh/Cl_Lists.hh>
#include <tokwh/Cl_Math.hh>
#include <tokwh/Cl_Paragraphs.hh>
#include <tokwh/Cl_Sections.hh>
#include <tokwh/Cl_Tables.hh>
#include <tokwh/Cl_Tasklists.hh>

std::shared_ptr<TWCollector>
tokwh::makeReferenceCollector(std::string const& name, TWConfig const& config)
{
    if (name == "codeblocks") {
        return std::make_shared<Cl_Codeblocks>();
    } else if (name == "footnotes") {
        return std::make_shared<Cl_Footnotes>();
    } else if (name == "headings") {
        return std::make_shared<Cl_Headings>();
    } else if (name == "html") {
        return std::make_shared<Cl_Html>(config);
    } else if (name == "images") {
        return std::make_shared<Cl_Images>(config);
    } else if (name == "links") {
        return std::make_shared<Cl_Links>(config);
    } else if (name == "lists") {
        return std::make_shared<Cl_Lists>();
    } else if (name == "math") {
        return std::make_shared<Cl_Math>();
    } else if (name == "paragraphs") {
        return std::make_shared<Cl_Paragraphs>();
    } else if (name == "sections") {
        return std::make_shared<Cl_Sections>();
    } else if (name == "tables") {
        return std::make_shared<Cl_Tables>();
    } else if (name == "tasklists") {
        return std::make_shared<Cl_Tasklists>();
    }
    return nullptr;
}

std::vector<std::shared_ptr<TWCollector>>
tokwh::makeReferenceCollectors(TWConfig const& config)
{
    std::vector<std::shared_ptr<TWCollector>> result;
    for (auto name:
         {"codeblocks",
          "footnotes",
          "headings",
          "html",
          "images",
          "links",
          "lists",
          "math",
          "paragraphs",
          "sections",
          "tables",
          "tasklists"}) {
        result.push_back(makeReferenceCollector(name, config));
    }
    return result;
}
