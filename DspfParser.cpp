/*
* Copyright 2025 Rochus Keller <mailto:me@rochus-keller.ch>
*
* This file is part of the DspfEdit parser/navigator project.
*
* The following is the license that applies to this copy of the
* file. For a license to use the file under conditions
* other than those described here, please email to me@rochus-keller.ch.
*
* GNU General Public License Usage
* This file may be used under the terms of the GNU General Public
* License (GPL) versions 2.0 or 3.0 as published by the Free Software
* Foundation and appearing in the file LICENSE.GPL included in
* the packaging of this file. Please review the following information
* to ensure GNU General Public Licensing requirements will be met:
* http://www.fsf.org/licensing/licenses/info/GPLv2.html and
* http://www.gnu.org/copyleft/gpl.html.
*/

#include "DspfParser.h"
#include "DspfLineFormat.h"
#include "DspfLinker.h"
#include "DspfScreenSize.h"
using namespace Dspf;

Parser::Parser()
{
}

Document Parser::parseDocument(const QString& text)
{
    Parser p;
    return p.parse(text);
}

Document Parser::parse(const QString& text)
{
    d_lines = LineFormatter::splitLines(text);
    d_catalog.clear();
    d_recordNames.clear();

    Document doc;
    doc.lineCount = d_lines.size();
    doc.elements.append( Element(Element::FileDecl, 0) );

    int i = 0;
    while( i < d_lines.size() )
    {
        Element e;
        if( classify(i, e) )
        {
            Q_ASSERT( e.lastLineIndex >= i );
            doc.elements.append(e);
            i = e.lastLineIndex + 1;
        }else
            i++;
    }
    doc.catalog = d_catalog;

    Linker::link(doc);
    ScreenSize::resolve(doc);
    Linker::assignEndLines(doc);

    d_lines.clear();
    d_catalog.clear();
    return doc;
}

bool Parser::classify(int lineIndex, Element& out)
{
    const SourceLine line(d_lines[lineIndex]);
    if( line.isComment() )
        return false;
    if( line.isRecord() )
    {
        recordDecl(line, lineIndex, out);
        return true;
    }
    if( !line.name().isEmpty() )
    {
        fieldDecl(line, lineIndex, out);
        return true;
    }
    if( line.row() > 0 && line.col() > 0 )
    {
        constDecl(line, lineIndex, out);
        return true;
    }
    return attrLine(line, lineIndex, out);
}

void Parser::recordDecl(const SourceLine& line, int lineIndex, Element& out)
{
    out = Element(Element::RecordDecl, lineIndex);
    out.name = line.name();

    // record level keywords are never conditioned
    const LineFormatter::Merged kw = LineFormatter::mergeKeywords(d_lines, lineIndex);
    if( !kw.text.isEmpty() )
        out.attributes << Attribute(kw.text, Indicators(), lineIndex, kw.lastLine);
    out.lastLineIndex = qMax(lineIndex, kw.lastLine);

    if( d_recordNames.contains(out.name) )
        return; // first declaration owns the catalog entry
    d_recordNames.insert(out.name);
    RecordEntry entry;
    entry.name = out.name;
    entry.attributes = out.attributeTexts();
    entry.startLine = lineIndex;
    d_catalog.append(entry);
}

void Parser::fieldDecl(const SourceLine& line, int lineIndex, Element& out)
{
    out = Element(Element::FieldDecl, lineIndex);
    out.name = line.name();
    out.type = line.type().isNull() ? QChar(' ') : line.type();
    out.usage = line.usage().isNull() ? QChar(' ') : line.usage();
    out.length = SourceLine::toNumber(line.lengthDigits());
    bool ok;
    const int dec = SourceLine::toNumber(line.decimalsDigits(), &ok);
    out.decimals = ok ? dec : -1;
    out.hidden = line.isHidden();
    out.referenced = line.isReferenced();
    out.indicators = LineFormatter::decodeIndicators(line.indicatorSegment());
    if( !out.hidden )
    {
        out.row = line.row();
        out.col = line.col();
    }

    const LineFormatter::Merged kw = LineFormatter::mergeKeywords(d_lines, lineIndex);
    if( !kw.text.isEmpty() )
        out.attributes << Attribute(kw.text, out.indicators, lineIndex, kw.lastLine);
    out.lastLineIndex = qMax(lineIndex, kw.lastLine);
}

void Parser::constDecl(const SourceLine& line, int lineIndex, Element& out)
{
    out = Element(Element::ConstDecl, lineIndex);
    out.row = line.row();
    out.col = line.col();
    out.indicators = LineFormatter::decodeIndicators(line.indicatorSegment());

    // the keyword area holds the literal itself; keywords of the constant follow on own lines
    const LineFormatter::Merged lit = LineFormatter::mergeConstant(d_lines, lineIndex);
    out.name = lit.text;
    out.lastLineIndex = qMax(lineIndex, lit.lastLine);
}

bool Parser::attrLine(const SourceLine& line, int lineIndex, Element& out)
{
    const LineFormatter::Merged kw = LineFormatter::mergeKeywords(d_lines, lineIndex);
    if( kw.text.isEmpty() )
        return false;
    out = Element(Element::AttrLine, lineIndex);
    out.indicators = LineFormatter::decodeIndicators(line.indicatorSegment());
    out.attributes << Attribute(kw.text, out.indicators, lineIndex, kw.lastLine);
    out.lastLineIndex = qMax(lineIndex, kw.lastLine);
    return true;
}
