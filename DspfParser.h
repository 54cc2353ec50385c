#ifndef DSPFPARSER_H
#define DSPFPARSER_H

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

#include <DspfAst.h>
#include <QSet>

namespace Dspf
{
    class SourceLine;

    // Builds a Document from the complete text of a display file. Each call is a full
    // reparse; the returned Document shares nothing with previous results.
    class Parser
    {
    public:
        Parser();
        Document parse(const QString& text);

        static Document parseDocument(const QString& text);
    protected:
        bool classify(int lineIndex, Element& out);
        void recordDecl(const SourceLine& line, int lineIndex, Element& out);
        void fieldDecl(const SourceLine& line, int lineIndex, Element& out);
        void constDecl(const SourceLine& line, int lineIndex, Element& out);
        bool attrLine(const SourceLine& line, int lineIndex, Element& out);
    private:
        QStringList d_lines;
        Catalog d_catalog;
        QSet<QString> d_recordNames;
    };
}

#endif // DSPFPARSER_H
